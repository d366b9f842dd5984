// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>


namespace framestate::primitive {

enum class AssociationKind { Ubiquitous, FrameAvoiding, SingleFrame };

constexpr std::string_view AssociationKind_to_str(AssociationKind kind) {
    switch (kind) {
    case AssociationKind::Ubiquitous:
        return "Ubiquitous";
    case AssociationKind::FrameAvoiding:
        return "FrameAvoiding";
    case AssociationKind::SingleFrame:
        return "SingleFrame";
    default:
        return "Undefined";
    }
}

enum class PrimitiveType {
    VerticalCursor,
    HorizontalCursor,
    CrosshairCursor,
    PointCursor,
    Point,
    Line,
    Rectangle,
    Ellipse,
    Polygon,
    Path
};

constexpr std::string_view PrimitiveType_to_str(PrimitiveType type) {
    switch (type) {
    case PrimitiveType::VerticalCursor:
        return "VerticalCursor";
    case PrimitiveType::HorizontalCursor:
        return "HorizontalCursor";
    case PrimitiveType::CrosshairCursor:
        return "CrosshairCursor";
    case PrimitiveType::PointCursor:
        return "PointCursor";
    case PrimitiveType::Point:
        return "Point";
    case PrimitiveType::Line:
        return "Line";
    case PrimitiveType::Rectangle:
        return "Rectangle";
    case PrimitiveType::Ellipse:
        return "Ellipse";
    case PrimitiveType::Polygon:
        return "Polygon";
    case PrimitiveType::Path:
        return "Path";
    default:
        return "Undefined";
    }
}

constexpr bool is_cursor(PrimitiveType type) {
    return type == PrimitiveType::VerticalCursor || type == PrimitiveType::HorizontalCursor ||
           type == PrimitiveType::CrosshairCursor || type == PrimitiveType::PointCursor;
}

} // namespace framestate::primitive
