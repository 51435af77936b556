#pragma once

#include <string>

namespace jsminify::minifier {

class CommentStripper {
public:
    // Removes line and block comments. Comment markers inside string,
    // template and regex literals are left alone.
    static std::string strip(const std::string& source);
};

} // namespace jsminify::minifier
