#pragma once
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include <boost/serialization/access.hpp>

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <nlohmann/json.hpp>

#include <rig/Point.hpp>

using json = nlohmann::json;

/**
 * Rigid transform with non-uniform scale, as reported by body tracking
 * sensors for a joint relative to the skeleton root.
 *
 * Applied to a point p as: position + rotation * (scale * p)
 */
template <typename Value>
class Transform {
public:
    typedef Eigen::Quaternion<Value> Rotation;
    typedef Eigen::Matrix<Value, 4, 4> Matrix4;

    Point<Value> position;
    Rotation rotation = Rotation::Identity();
    Point<Value> scale = Point<Value>(1, 1, 1);

    Transform() = default;

    Transform(Point<Value> m_position)
        : position(m_position)
    {
    }

    Transform(Point<Value> m_position, Rotation m_rotation, Point<Value> m_scale = Point<Value>(1, 1, 1))
        : position(m_position)
        , rotation(m_rotation)
        , scale(m_scale)
    {
    }

    static Transform<Value> identity()
    {
        return Transform<Value>();
    }

    // Decomposes an affine 4x4 matrix (ARKit model transform layout). Shear is
    // dropped, a zero scale column keeps the identity axis for the rotation.
    static Transform<Value> from_matrix(const Matrix4& matrix)
    {
        Transform<Value> result;
        result.position = Point<Value>(matrix(0, 3), matrix(1, 3), matrix(2, 3));

        Eigen::Matrix<Value, 3, 3> linear = matrix.template block<3, 3>(0, 0);
        Eigen::Matrix<Value, 3, 3> axes = Eigen::Matrix<Value, 3, 3>::Identity();
        Value scales[3];
        for (int i = 0; i < 3; ++i) {
            scales[i] = linear.col(i).norm();
            if (scales[i] > std::numeric_limits<Value>::min()) {
                axes.col(i) = linear.col(i) / scales[i];
            }
        }
        result.scale = Point<Value>(scales[0], scales[1], scales[2]);
        result.rotation = Rotation(axes);
        result.rotation.normalize();
        return result;
    }

    Matrix4 to_matrix() const
    {
        Matrix4 matrix = Matrix4::Identity();
        Eigen::Matrix<Value, 3, 3> linear = rotation.toRotationMatrix();
        linear.col(0) *= scale.x;
        linear.col(1) *= scale.y;
        linear.col(2) *= scale.z;
        matrix.template block<3, 3>(0, 0) = linear;
        matrix(0, 3) = position.x;
        matrix(1, 3) = position.y;
        matrix(2, 3) = position.z;
        return matrix;
    }

    Point<Value> apply(const Point<Value>& point) const
    {
        Eigen::Matrix<Value, 3, 1> scaled = (point * scale).to_eigen();
        return position + Point<Value>(Eigen::Matrix<Value, 3, 1>(rotation * scaled));
    }

    // parent * child, maps the child from parent-relative into the parent's frame
    Transform<Value> operator*(const Transform<Value>& child) const
    {
        Transform<Value> result;
        result.position = apply(child.position);
        result.rotation = rotation * child.rotation;
        result.scale = scale * child.scale;
        return result;
    }

    template <typename U>
    friend bool operator==(const Transform<U>& lhs, const Transform<U>& rhs);

    friend class boost::serialization::access;
    template <class Archive>
    void serialize(Archive& ar, const unsigned int version)
    {
        ar& position;
        ar& rotation.w();
        ar& rotation.x();
        ar& rotation.y();
        ar& rotation.z();
        ar& scale;
    }
};

template <typename Value>
bool operator==(const Transform<Value>& lhs, const Transform<Value>& rhs)
{
    return lhs.position == rhs.position && lhs.rotation.coeffs() == rhs.rotation.coeffs() && lhs.scale == rhs.scale;
}

template <typename Value>
std::ostream& operator<<(std::ostream& out, const Transform<Value>& transform)
{
    out << "Transform(" << transform.position << ", Quaternion(" << transform.rotation.w() << ", "
        << transform.rotation.x() << ", " << transform.rotation.y() << ", " << transform.rotation.z()
        << "), " << transform.scale << ')';
    return out;
}

template <typename Value>
void to_json(json& _json, const Transform<Value>& value)
{
    _json = json::object();
    _json["position"] = value.position;
    _json["rotation"] = std::vector<Value> { value.rotation.w(), value.rotation.x(), value.rotation.y(), value.rotation.z() };
    _json["scale"] = value.scale;
}

/**
 * Accepts either an object {"position", "rotation" (w, x, y, z), "scale"}
 * where only the position is required, or a flat column-major 4x4 matrix.
 */
template <typename Value>
void from_json(const json& _json, Transform<Value>& value)
{
    if (_json.is_array()) {
        if (_json.size() != 16) {
            throw std::invalid_argument("transform matrix needs 16 values, got " + std::to_string(_json.size()));
        }
        typename Transform<Value>::Matrix4 matrix;
        for (int col = 0; col < 4; ++col) {
            for (int row = 0; row < 4; ++row) {
                matrix(row, col) = _json[col * 4 + row].get<Value>();
            }
        }
        value = Transform<Value>::from_matrix(matrix);
        return;
    }

    value = Transform<Value>();
    value.position = _json.at("position").get<Point<Value>>();
    if (_json.contains("rotation")) {
        auto& rotation = _json["rotation"];
        value.rotation = typename Transform<Value>::Rotation(
            rotation.at(0).get<Value>(), rotation.at(1).get<Value>(),
            rotation.at(2).get<Value>(), rotation.at(3).get<Value>());
        value.rotation.normalize();
    }
    if (_json.contains("scale")) {
        value.scale = _json["scale"].get<Point<Value>>();
    }
}
