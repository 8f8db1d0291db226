#include "application/NumberFormatter.hpp"
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace logicchat::application {

namespace {

std::ostringstream ClassicStream() {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    return out;
}

double ReadBack(const std::string& text) {
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    return value;
}

} // namespace

std::string FormatNumber(double value) {
    if (value == 0.0) {
        return "0";
    }
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    if (std::trunc(value) == value) {
        auto out = ClassicStream();
        out << std::fixed << std::setprecision(0) << value;
        return out.str();
    }

    std::string text;
    for (int precision = 1; precision <= 17; ++precision) {
        auto out = ClassicStream();
        out << std::setprecision(precision) << value;
        text = out.str();
        if (ReadBack(text) == value) {
            break;
        }
    }
    return text;
}

} // namespace logicchat::application
