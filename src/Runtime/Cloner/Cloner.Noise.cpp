module;

#include <cmath>
#include <cstdint>

module Cloner:Noise.Impl;

import :Noise;

namespace Cloner::Noise
{
    static constexpr double kYStride = 57.0;
    static constexpr double kZStride = 113.0;

    static double Hash(double n)
    {
        const double s = std::sin(n) * 43758.5453123;
        return s - std::floor(s);
    }

    static double Smooth(double t)
    {
        return t * t * (3.0 - 2.0 * t);
    }

    static double Lerp(double a, double b, double t)
    {
        return a * (1.0 - t) + b * t;
    }

    static double Corner(double ix, double iy, double iz)
    {
        return Hash(ix + iy * kYStride + iz * kZStride);
    }

    double Sample(double x, double y, double z, double frequency)
    {
        const double fx = x * frequency;
        const double fy = y * frequency;
        const double fz = z * frequency;

        const double ix = std::floor(fx);
        const double iy = std::floor(fy);
        const double iz = std::floor(fz);

        const double sx = Smooth(fx - ix);
        const double sy = Smooth(fy - iy);
        const double sz = Smooth(fz - iz);

        const double n000 = Corner(ix, iy, iz);
        const double n001 = Corner(ix, iy, iz + 1.0);
        const double n010 = Corner(ix, iy + 1.0, iz);
        const double n011 = Corner(ix, iy + 1.0, iz + 1.0);
        const double n100 = Corner(ix + 1.0, iy, iz);
        const double n101 = Corner(ix + 1.0, iy, iz + 1.0);
        const double n110 = Corner(ix + 1.0, iy + 1.0, iz);
        const double n111 = Corner(ix + 1.0, iy + 1.0, iz + 1.0);

        // Blend along X, then Y, then Z
        const double n00 = Lerp(n000, n100, sx);
        const double n01 = Lerp(n001, n101, sx);
        const double n10 = Lerp(n010, n110, sx);
        const double n11 = Lerp(n011, n111, sx);

        const double n0 = Lerp(n00, n10, sy);
        const double n1 = Lerp(n01, n11, sy);

        return Lerp(n0, n1, sz);
    }

    double Fractal(double x, double y, double z, double frequency, std::uint32_t octaves)
    {
        if (octaves <= 1)
            return Sample(x, y, z, frequency);

        double sum = 0.0;
        double weight = 1.0;
        double totalWeight = 0.0;
        double f = frequency;
        for (std::uint32_t o = 0; o < octaves; ++o)
        {
            sum += Sample(x, y, z, f) * weight;
            totalWeight += weight;
            weight *= 0.5;
            f *= 2.0;
        }
        return sum / totalWeight;
    }
}
