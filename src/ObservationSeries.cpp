#include "seasonfit/ObservationSeries.hpp"
#include "seasonfit/Errors.hpp"
#include <cmath>
#include <utility>

namespace seasonfit {

ObservationSeries::ObservationSeries(Vector x_, Vector y_, Vector w_)
    : x(std::move(x_)), y(std::move(y_)), w(std::move(w_))
{}

Vector ObservationSeries::weights() const
{
    if (w.size() == 0) return Vector::Ones(x.size());
    return w;
}

int ObservationSeries::n_effective() const
{
    if (w.size() == 0) return static_cast<int>(x.size());
    return static_cast<int>((w.array() > 0.0).count());
}

void ObservationSeries::validate() const
{
    if (x.size() != y.size())
        throw InputValidationError(
            "series: x and y differ in length (" + std::to_string(x.size()) +
            " vs " + std::to_string(y.size()) + ")");

    if (w.size() != 0 && w.size() != x.size())
        throw InputValidationError(
            "series: weights have length " + std::to_string(w.size()) +
            ", expected " + std::to_string(x.size()));

    if (x.size() < kMinSamples)
        throw InputValidationError(
            "series: " + std::to_string(x.size()) + " samples, at least " +
            std::to_string(kMinSamples) + " required");

    if (!x.allFinite())
        throw InputValidationError("series: non-finite abscissa");

    for (Eigen::Index i = 0; i < w.size(); ++i) {
        if (!std::isfinite(w[i]) || w[i] < 0.0)
            throw InputValidationError(
                "series: weight " + std::to_string(i) +
                " is negative or not finite");
    }

    /* a masked sample may hold anything, e.g. a NaN fill value */
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        const bool counted = w.size() == 0 || w[i] > 0.0;
        if (counted && !std::isfinite(y[i]))
            throw InputValidationError(
                "series: value " + std::to_string(i) + " is not finite");
    }
}

ObservationSeries ObservationSeries::with_precision(Precision p) const
{
    if (p == Precision::Double) return *this;

    ObservationSeries out;
    out.x = x.cast<float>().cast<double>();
    out.y = y.cast<float>().cast<double>();
    if (w.size() != 0) out.w = w.cast<float>().cast<double>();
    return out;
}

ObservationSeries ObservationSeries::without(Eigen::Index i) const
{
    const Eigen::Index n = x.size();
    if (i < 0 || i >= n)
        throw InputValidationError("series: index out of range");

    auto drop = [&](const Vector& v) {
        Vector out(n - 1);
        out << v.head(i), v.tail(n - i - 1);
        return out;
    };

    ObservationSeries out;
    out.x = drop(x);
    out.y = drop(y);
    if (w.size() != 0) out.w = drop(w);
    return out;
}

std::string to_string(Precision p)
{
    return p == Precision::Single ? "single" : "double";
}

Precision precision_from_string(const std::string& s)
{
    if (s == "single" || s == "float32") return Precision::Single;
    if (s == "double" || s == "float64") return Precision::Double;
    throw InputValidationError("unknown precision '" + s + "'");
}

} // namespace seasonfit
