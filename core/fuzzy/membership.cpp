#include "fuzzy/membership.hpp"
#include <cmath>
#include <sstream>

namespace hegel {

MembershipFunction MembershipFunction::triangular(double low, double peak, double high) {
    return {Shape::TRIANGULAR, low, peak, high, 0.0};
}

MembershipFunction MembershipFunction::trapezoidal(double low, double low_peak,
                                                   double high_peak, double high) {
    return {Shape::TRAPEZOIDAL, low, low_peak, high_peak, high};
}

MembershipFunction MembershipFunction::gaussian(double center, double sigma) {
    return {Shape::GAUSSIAN, center, sigma, 0.0, 0.0};
}

MembershipFunction MembershipFunction::sigmoid(double center, double slope) {
    return {Shape::SIGMOID, center, slope, 0.0, 0.0};
}

double MembershipFunction::membership(double value) const {
    switch (shape) {
        case Shape::TRIANGULAR: {
            const double low = a, peak = b, high = c;
            if (value < low || value > high) return 0.0;
            // A zero-width side is a vertical shoulder at the peak.
            if (value == peak) return 1.0;
            if (value < peak) return (value - low) / (peak - low);
            return (high - value) / (high - peak);
        }
        case Shape::TRAPEZOIDAL: {
            const double low = a, low_peak = b, high_peak = c, high = d;
            if (value < low || value > high) return 0.0;
            if (value >= low_peak && value <= high_peak) return 1.0;
            if (value < low_peak) return (value - low) / (low_peak - low);
            return (high - value) / (high - high_peak);
        }
        case Shape::GAUSSIAN: {
            const double center = a, sigma = b;
            if (sigma <= 0.0) return value == center ? 1.0 : 0.0;
            double z = (value - center) / sigma;
            return std::exp(-0.5 * z * z);
        }
        case Shape::SIGMOID: {
            const double center = a, slope = b;
            return 1.0 / (1.0 + std::exp(-slope * (value - center)));
        }
    }
    return 0.0;
}

std::string MembershipFunction::describe() const {
    std::ostringstream ss;
    ss << toString(shape) << "(";
    switch (shape) {
        case Shape::TRIANGULAR:
            ss << a << ", " << b << ", " << c;
            break;
        case Shape::TRAPEZOIDAL:
            ss << a << ", " << b << ", " << c << ", " << d;
            break;
        case Shape::GAUSSIAN:
        case Shape::SIGMOID:
            ss << a << ", " << b;
            break;
    }
    ss << ")";
    return ss.str();
}

std::string toString(MembershipFunction::Shape shape) {
    switch (shape) {
        case MembershipFunction::Shape::TRIANGULAR:  return "triangular";
        case MembershipFunction::Shape::TRAPEZOIDAL: return "trapezoidal";
        case MembershipFunction::Shape::GAUSSIAN:    return "gaussian";
        case MembershipFunction::Shape::SIGMOID:     return "sigmoid";
    }
    return "unknown";
}

} // namespace hegel
