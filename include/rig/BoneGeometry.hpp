#pragma once
#include <limits>

#include <boost/serialization/access.hpp>

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <nlohmann/json.hpp>

#include <rig/Point.hpp>
#include <rig/Transform.hpp>

using json = nlohmann::json;

/**
 * Placement of an elongated primitive spanning two joints.
 *
 * The primitive's long axis is local +Z: orientation * (0, 0, 1) is the unit
 * direction from the parent joint to the child joint.
 */
template <typename Value>
class BoneGeometry {
public:
    typedef Eigen::Quaternion<Value> Rotation;

    Point<Value> center;
    Value length = 0;
    Rotation orientation = Rotation::Identity();

    BoneGeometry() = default;
    BoneGeometry(Point<Value> m_center, Value m_length, Rotation m_orientation)
        : center(m_center)
        , length(m_length)
        , orientation(m_orientation)
    {
    }

    bool is_degenerate() const { return length == 0; }

    Point<Value> direction() const
    {
        return Point<Value>(Eigen::Matrix<Value, 3, 1>(orientation * Eigen::Matrix<Value, 3, 1>::UnitZ()));
    }

    // Box extents for a primitive of the given cross-section
    Point<Value> scale(Value diameter) const
    {
        return Point<Value>(diameter, diameter, length);
    }

    Transform<Value> transform() const
    {
        return Transform<Value>(center, orientation);
    }

    template <typename U>
    friend bool operator==(const BoneGeometry<U>& lhs, const BoneGeometry<U>& rhs);

    friend class boost::serialization::access;
    template <class Archive>
    void serialize(Archive& ar, const unsigned int version)
    {
        ar& center;
        ar& length;
        ar& orientation.w();
        ar& orientation.x();
        ar& orientation.y();
        ar& orientation.z();
    }
};

template <typename Value>
bool operator==(const BoneGeometry<Value>& lhs, const BoneGeometry<Value>& rhs)
{
    return lhs.center == rhs.center && lhs.length == rhs.length && lhs.orientation.coeffs() == rhs.orientation.coeffs();
}

template <typename Value>
bool operator!=(const BoneGeometry<Value>& lhs, const BoneGeometry<Value>& rhs)
{
    return !(lhs == rhs);
}

template <typename Value>
void to_json(json& _json, const BoneGeometry<Value>& value)
{
    _json = json::object();
    _json["center"] = value.center;
    _json["length"] = value.length;
    _json["orientation"] = std::vector<Value> { value.orientation.w(), value.orientation.x(), value.orientation.y(), value.orientation.z() };
}

/**
 * Derives a bone's placement from its two joints. Pure, the same inputs give
 * bit-identical outputs.
 *
 * Coincident joints give length 0 and the identity orientation.
 */
template <typename Value>
BoneGeometry<Value> derive_bone_geometry(const Point<Value>& from, const Point<Value>& to)
{
    BoneGeometry<Value> geometry;
    geometry.center = from.midpoint(to);
    geometry.length = from.distance(to);

    Eigen::Matrix<Value, 3, 1> direction = (to - geometry.center).to_eigen();
    Value half_length = direction.norm();
    if (!(half_length > std::numeric_limits<Value>::min())) {
        geometry.orientation = BoneGeometry<Value>::Rotation::Identity();
        return geometry;
    }

    geometry.orientation = BoneGeometry<Value>::Rotation::FromTwoVectors(
        Eigen::Matrix<Value, 3, 1>::UnitZ(), direction / half_length);
    return geometry;
}

template <typename Value>
BoneGeometry<Value> derive_bone_geometry(const Transform<Value>& from, const Transform<Value>& to)
{
    return derive_bone_geometry(from.position, to.position);
}
