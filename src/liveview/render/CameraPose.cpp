#include <liveview/render/CameraPose.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace LV::Render {

namespace {

using Mat3 = std::array<std::array<double, 3>, 3>;
using Vec3 = std::array<double, 3>;

auto multiply(Mat3 const& a, Mat3 const& b) -> Mat3 {
    Mat3 out{};
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            out[r][c] = a[r][0] * b[0][c] + a[r][1] * b[1][c] + a[r][2] * b[2][c];
        }
    }
    return out;
}

auto multiply(Mat3 const& m, Vec3 const& v) -> Vec3 {
    return Vec3{
        m[0][0] * v[0] + m[0][1] * v[1] + m[0][2] * v[2],
        m[1][0] * v[0] + m[1][1] * v[1] + m[1][2] * v[2],
        m[2][0] * v[0] + m[2][1] * v[1] + m[2][2] * v[2],
    };
}

auto cross(Vec3 const& a, Vec3 const& b) -> Vec3 {
    return Vec3{
        a[1] * b[2] - a[2] * b[1],
        a[2] * b[0] - a[0] * b[2],
        a[0] * b[1] - a[1] * b[0],
    };
}

// Extrinsic x, then y, then z: R = Rz(c) * Ry(b) * Rx(a).
auto euler_xyz(double a, double b, double c) -> Mat3 {
    auto const ca = std::cos(a), sa = std::sin(a);
    auto const cb = std::cos(b), sb = std::sin(b);
    auto const cc = std::cos(c), sc = std::sin(c);
    Mat3 const rx{{{1.0, 0.0, 0.0}, {0.0, ca, -sa}, {0.0, sa, ca}}};
    Mat3 const ry{{{cb, 0.0, sb}, {0.0, 1.0, 0.0}, {-sb, 0.0, cb}}};
    Mat3 const rz{{{cc, -sc, 0.0}, {sc, cc, 0.0}, {0.0, 0.0, 1.0}}};
    return multiply(rz, multiply(ry, rx));
}

constexpr double kDegToRad = std::numbers::pi / 180.0;

} // namespace

auto is_finite(CameraPose const& pose) -> bool {
    auto finite = [](float value) { return std::isfinite(value); };
    return std::ranges::all_of(pose.position, finite) && std::ranges::all_of(pose.rotation, finite);
}

auto camera_to_world(CameraPose const& pose) -> Matrix4 {
    auto const [x, y, z] = pose.position;

    auto const viewer_rotation = euler_xyz(pose.rotation[0] * kDegToRad,
                                           pose.rotation[1] * kDegToRad,
                                           pose.rotation[2] * kDegToRad);
    // Viewer axes (x right, y up, z back) expressed in the world frame.
    Mat3 const viewer_to_world{{{0.0, 0.0, 1.0}, {-1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}}};
    auto const view_dir = multiply(multiply(viewer_to_world, viewer_rotation), Vec3{0.0, 0.0, 1.0});

    Vec3 const forward{0.0, 0.0, -1.0};
    auto const axis = cross(forward, view_dir);

    auto const yaw = std::atan2(axis[1], axis[0]);
    auto const pitch = std::asin(std::clamp(axis[2], -1.0, 1.0));
    auto const roll = std::atan2(-forward[2], forward[0]);
    auto const rotation = euler_xyz(roll, pitch, yaw);

    Matrix4 out{};
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            out[static_cast<std::size_t>(r * 4 + c)] = static_cast<float>(rotation[r][c]);
        }
    }
    out[3] = z;
    out[7] = -x;
    out[11] = y;
    out[15] = 1.0f;
    return out;
}

} // namespace LV::Render
