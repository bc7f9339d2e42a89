module;

#include <cstdint>

export module Cloner:Noise;

export namespace Cloner::Noise
{
    // =========================================================================
    // Lattice value noise
    // =========================================================================
    //
    // The sample point is scaled by `frequency`, the eight corners of the
    // enclosing integer cell are hashed to pseudo-random values in [0, 1) and
    // blended with smoothstep-weighted trilinear interpolation:
    //
    //   hash(n) = fract(sin(n) * 43758.5453123),  n = ix + 57*iy + 113*iz
    //
    // The result depends only on the coordinates, never on call order, so two
    // coincident samples always agree and the field is continuous across cell
    // boundaries. Output is approximately unit scale; callers apply their own
    // amplitude.
    [[nodiscard]] double Sample(double x, double y, double z, double frequency);

    // Sum of `octaves` samples, doubling the frequency and halving the weight
    // each octave, normalized by the total weight. With octaves <= 1 this is
    // exactly Sample().
    [[nodiscard]] double Fractal(double x, double y, double z, double frequency, std::uint32_t octaves);
}
