#include <gtest/gtest.h>
#include <sstream>

#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>

#include <rig/Point.hpp>
#include <rig/Transform.hpp>

TEST(PointConstructor, BasicAssertions)
{
    double test[3] = { 1, 2, 3 };
    Point<double> value(test[0], test[1], test[2]);
    EXPECT_EQ(value.x, 1);
    EXPECT_EQ(value.y, 2);
    EXPECT_EQ(value.z, 3);

    Point<double> from_eigen(Eigen::Vector3d(4, 5, 6));
    EXPECT_EQ(from_eigen, Point<double>(4, 5, 6));
}

TEST(PointArithmetic, BasicAssertions)
{
    Point<double> a(0, 0, 0);
    Point<double> b(3, 4, 0);
    EXPECT_EQ(a.distance(b), 5);
    EXPECT_EQ(a.midpoint(b), Point<double>(1.5, 2, 0));
    EXPECT_EQ(b.normalized(), Point<double>(0.6, 0.8, 0));
    EXPECT_EQ(Point<double>(1, 0, 0).cross_product(Point<double>(0, 1, 0)), Point<double>(0, 0, 1));
}

TEST(TransformFromMatrix, BasicAssertions)
{
    // 90 degrees about z, scaled by 2, translated
    Eigen::Matrix4d matrix = Eigen::Matrix4d::Identity();
    matrix.block<3, 3>(0, 0) = Eigen::AngleAxisd(M_PI / 2, Eigen::Vector3d::UnitZ()).toRotationMatrix() * 2.0;
    matrix(0, 3) = 1;
    matrix(1, 3) = 2;
    matrix(2, 3) = 3;

    auto transform = Transform<double>::from_matrix(matrix);
    EXPECT_EQ(transform.position, Point<double>(1, 2, 3));
    EXPECT_NEAR(transform.scale.x, 2, 1e-12);
    EXPECT_NEAR(transform.scale.y, 2, 1e-12);
    EXPECT_NEAR(transform.scale.z, 2, 1e-12);

    auto applied = transform.apply(Point<double>(1, 0, 0));
    EXPECT_NEAR(applied.x, 1, 1e-12);
    EXPECT_NEAR(applied.y, 4, 1e-12);
    EXPECT_NEAR(applied.z, 3, 1e-12);

    EXPECT_TRUE(transform.to_matrix().isApprox(matrix, 1e-12));
}

TEST(TransformComposition, BasicAssertions)
{
    Transform<double> root(Point<double>(10, 0, 0),
        Eigen::Quaterniond(Eigen::AngleAxisd(M_PI, Eigen::Vector3d::UnitY())));
    Transform<double> joint(Point<double>(1, 2, 0));

    auto world = root * joint;
    EXPECT_NEAR(world.position.x, 9, 1e-12);
    EXPECT_NEAR(world.position.y, 2, 1e-12);
    EXPECT_NEAR(world.position.z, 0, 1e-12);
}

TEST(TransformJson, BasicAssertions)
{
    json position_only = { { "position", { 1.0, 2.0, 3.0 } } };
    auto transform = position_only.get<Transform<double>>();
    EXPECT_EQ(transform.position, Point<double>(1, 2, 3));
    EXPECT_TRUE(transform.rotation.coeffs().isApprox(Eigen::Quaterniond::Identity().coeffs()));
    EXPECT_EQ(transform.scale, Point<double>(1, 1, 1));

    // column-major 4x4, translation in the last column
    json matrix = { 1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1, 0, 0.5, -1, 2, 1 };
    auto from_matrix = matrix.get<Transform<double>>();
    EXPECT_EQ(from_matrix.position, Point<double>(0.5, -1, 2));

    json too_short = { 1, 0, 0 };
    EXPECT_THROW(too_short.get<Transform<double>>(), std::invalid_argument);
}

TEST(TransformBoostSerialization, BasicAssertions)
{
    Transform<double> transform(Point<double>(0.25, 0.5, 1),
        Eigen::Quaterniond(Eigen::AngleAxisd(0.5, Eigen::Vector3d::UnitX())),
        Point<double>(1, 2, 1));

    std::stringstream stream;
    {
        boost::archive::text_oarchive oa(stream);
        oa << transform;
    }
    Transform<double> restored;
    {
        boost::archive::text_iarchive ia(stream);
        ia >> restored;
    }
    EXPECT_TRUE(restored.position.distance(transform.position) < 1e-12);
    EXPECT_TRUE(restored.rotation.isApprox(transform.rotation, 1e-12));
    EXPECT_TRUE(restored.scale.distance(transform.scale) < 1e-12);
}
