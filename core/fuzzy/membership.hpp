#pragma once

#include <string>

namespace hegel {

// ─── Membership Function ───────────────────────────────────────
// Maps a crisp value to a degree in [0,1]. The shape is a closed set;
// every formula switches over Shape exhaustively.

struct MembershipFunction {
    enum class Shape {
        TRIANGULAR,     // (low, peak, high)
        TRAPEZOIDAL,    // (low, low_peak, high_peak, high)
        GAUSSIAN,       // (center, sigma)
        SIGMOID         // (center, slope)
    };

    Shape shape = Shape::TRIANGULAR;
    double a = 0.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;

    static MembershipFunction triangular(double low, double peak, double high);
    static MembershipFunction trapezoidal(double low, double low_peak,
                                          double high_peak, double high);
    static MembershipFunction gaussian(double center, double sigma);
    static MembershipFunction sigmoid(double center, double slope);

    /// Degree of membership of value, always in [0,1].
    double membership(double value) const;

    std::string describe() const;
};

std::string toString(MembershipFunction::Shape shape);

} // namespace hegel
