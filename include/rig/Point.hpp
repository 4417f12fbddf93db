#pragma once
#include <cmath>
#include <iostream>
#include <vector>

#include <boost/serialization/access.hpp>

#include <nlohmann/json.hpp>
#include <Eigen/Dense>

using json = nlohmann::json;

template <typename Value>
class Point {
public:
    Value x;
    Value y;
    Value z;

    Point()
    {
        x = 0;
        y = 0;
        z = 0;
    }
    Point(Value m_x, Value m_y, Value m_z)
        : x(m_x)
        , y(m_y)
        , z(m_z)
    {
    }
    Point(const Eigen::Matrix<Value, 3, 1>& vector)
        : x(vector(0))
        , y(vector(1))
        , z(vector(2))
    {
    }

    Eigen::Matrix<Value, 3, 1> to_eigen() const
    {
        return Eigen::Matrix<Value, 3, 1>(x, y, z);
    }

    Point<Value> cross_product(const Point<Value>& other) const
    {
        Point<Value> cross_product;
        cross_product.x = this->y * other.z - this->z * other.y;
        cross_product.y = this->z * other.x - this->x * other.z;
        cross_product.z = this->x * other.y - this->y * other.x;
        return cross_product;
    }

    Value norm() const
    {
        return std::sqrt(x * x + y * y + z * z);
    }

    Value distance(const Point<Value>& other) const
    {
        return (other - *this).norm();
    }

    Point<Value> midpoint(const Point<Value>& other) const
    {
        return Point<Value>((x + other.x) / 2, (y + other.y) / 2, (z + other.z) / 2);
    }

    Point<Value> normalized() const
    {
        auto norm = this->norm();
        Point<Value> copy(*this);
        return copy / norm;
    }

    Point<Value> operator+(Point<Value> const& other) const
    {
        Point<Value> result;
        result.x = this->x + other.x;
        result.y = this->y + other.y;
        result.z = this->z + other.z;
        return result;
    }

    Point<Value> operator-(Point<Value> const& other) const
    {
        Point<Value> result;
        result.x = this->x - other.x;
        result.y = this->y - other.y;
        result.z = this->z - other.z;
        return result;
    }

    Point<Value> operator*(Point<Value> const& other) const
    {
        Point<Value> result;
        result.x = this->x * other.x;
        result.y = this->y * other.y;
        result.z = this->z * other.z;
        return result;
    }

    Point<Value> operator*(Value const& value) const
    {
        Point<Value> result;
        result.x = this->x * value;
        result.y = this->y * value;
        result.z = this->z * value;
        return result;
    }

    Point<Value> operator/(Value const& value) const
    {
        Point<Value> result;
        result.x = this->x / value;
        result.y = this->y / value;
        result.z = this->z / value;
        return result;
    }

    template <typename U>
    friend std::ostream& operator<<(std::ostream& out, const Point<U>& point);

    template <typename U>
    friend bool operator==(const Point<U>& lhs, const Point<U>& rhs);

    friend class boost::serialization::access;
    template <class Archive>
    void serialize(Archive& ar, const unsigned int version)
    {
        ar& x;
        ar& y;
        ar& z;
    }
};

template <typename Value>
void to_json(json& _json, const Point<Value>& value)
{
    _json = json(std::vector<Value> { value.x, value.y, value.z });
}

template <typename Value>
void from_json(const json& _json, Point<Value>& value)
{
    value.x = _json.at(0).get<Value>();
    value.y = _json.at(1).get<Value>();
    value.z = _json.at(2).get<Value>();
}

template <typename Value>
std::ostream& operator<<(std::ostream& out, const Point<Value>& point)
{
    out << "Point(" << point.x << ", " << point.y << ", " << point.z
        << ')';

    return out;
}

template <typename Value>
bool operator==(const Point<Value>& lhs, const Point<Value>& rhs)
{
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.z == rhs.z;
}

template <typename Value>
bool operator!=(const Point<Value>& lhs, const Point<Value>& rhs)
{
    return !(lhs == rhs);
}
