/**
 * @file LagCovariance.cpp
 * @brief Implementation of the zero-padded lag-covariance expansion.
 */

#include "lcca/math/LagCovariance.hpp"

#include <string>

namespace lcca::math {

using core::ErrorCode;
using core::makeError;

core::Expected<Tensor6> expandLagCovariance(
    const Tensor5& compressed,
    Index tau)
{
    const Index lags = compressed.dimension(0);
    const Index nY = compressed.dimension(1);
    const Index nE = compressed.dimension(2);

    if (compressed.dimension(3) != nY || compressed.dimension(4) != nE)
        return makeError(
            ErrorCode::kShapeMismatch,
            "compressed Cyy must be (lag, nY, nE, nY, nE), got output axes " + std::to_string(nY) + "/"
                + std::to_string(compressed.dimension(3)) + " and event axes " + std::to_string(nE) + "/"
                + std::to_string(compressed.dimension(4)));

    if (tau < 1)
        return makeError(ErrorCode::kInvalidArgument, "tau must be >= 1, got " + std::to_string(tau));

    Tensor6 full(nY, nE, tau, nY, nE, tau);
    full.setZero();

    for (Index y = 0; y < nY; ++y)
        for (Index e = 0; e < nE; ++e)
            for (Index t = 0; t < tau; ++t)
                for (Index z = 0; z < nY; ++z)
                    for (Index f = 0; f < nE; ++f)
                        for (Index u = 0; u < tau; ++u) {
                            const Index delta = t >= u ? t - u : u - t;
                            if (delta >= lags)
                                continue;

                            if (delta == 0)
                                full(y, e, t, z, f, u) = 0.5 * (compressed(0, y, e, z, f) + compressed(0, z, f, y, e));
                            else if (t > u)
                                full(y, e, t, z, f, u) = compressed(delta, y, e, z, f);
                            else
                                full(y, e, t, z, f, u) = compressed(delta, z, f, y, e);
                        }

    return full;
}

core::Expected<Tensor6> expandLagCovariance(const Tensor5& compressed)
{
    return expandLagCovariance(compressed, compressed.dimension(0));
}

} // namespace lcca::math
