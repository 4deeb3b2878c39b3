#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "sk/core/point_cloud.h"

namespace sk {

using Vec3f = std::array<float, 3>;
using Rgb = std::array<float, 3>;

// Real spherical harmonics normalisation constants.
constexpr float kShC0 = 0.28209479177387814f;
constexpr float kShC1 = 0.4886025119029199f;
constexpr float kShC2[5] = {1.0925484305920792f, -1.0925484305920792f,
                            0.31539156525252005f, -1.0925484305920792f,
                            0.5462742152960396f};
constexpr float kShC3[7] = {-0.5900435899266435f, 2.890611442640554f,
                            -0.4570457994644658f, 0.3731763325901154f,
                            -0.4570457994644658f, 1.445305721320277f,
                            -0.5900435899266435f};

constexpr Vec3f kForwardDirection = {0.0f, 0.0f, 1.0f};

// Degree implied by a coefficient array length: <=3 -> 0, <=12 -> 1,
// <=27 -> 2, otherwise 3.
int DegreeForCoeffCount(size_t count);

// Unit-length copy of dir; the zero vector maps to kForwardDirection.
Vec3f NormalizeDirection(const Vec3f &dir);

// Band accumulators. `coeffs` is the full per-point array, `d` a unit vector.
// Each adds its band's contribution to `acc`.
void AccumulateShBand1(const float *coeffs, const Vec3f &d, Rgb &acc);
void AccumulateShBand2(const float *coeffs, const Vec3f &d, Rgb &acc);
void AccumulateShBand3(const float *coeffs, const Vec3f &d, Rgb &acc);

// Colour in [0, 1] for viewing direction `dir` using bands 0..degree.
// A degree outside 0..3 is inferred from `count` instead. A degree needing
// more coefficients than `count` holds is lowered to what `count` supports.
Rgb EvalSh(const float *coeffs, size_t count, const Vec3f &dir, int degree);
Rgb EvalSh(const std::vector<float> &coeffs, const Vec3f &dir, int degree);

// 0..255 colour seen from kForwardDirection.
std::array<uint8_t, 3> ShToRgb8(const float *coeffs, size_t count,
                                int degree = 0);

// Per-point RGBA for one viewing direction. Clouds with SH are evaluated in
// parallel; clouds without SH return their stored colours. Alpha is always
// the stored alpha.
std::vector<uint8_t> EvalShColors(const PointCloud &pc, const Vec3f &dir);

} // namespace sk
