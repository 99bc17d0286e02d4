#include "kestrel/view/length.hpp"

#include <sstream>

namespace kestrel {

std::string Length::toString() const {
    std::ostringstream ss;
    ss << value_ << (unit_ == Unit::Percent ? "%" : "px");
    return ss.str();
}

} // namespace kestrel
