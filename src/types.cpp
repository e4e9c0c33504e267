#include "plume/types.hpp"
#include "format.hpp"

namespace plume {

std::string Size::toString() const {
    std::string s;
    detail::appendShortest(s, points_);
    s += "pt";
    return s;
}

std::string Size2D::toString() const {
    return "[" + x.toString() + ", " + y.toString() + "]";
}

}
