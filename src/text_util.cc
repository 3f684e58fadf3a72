#include "text_util.h"

#include <stdexcept>

namespace md_writer {

std::size_t CountCodePoints(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char byte : text) {
        if ((byte & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string RepeatChar(char c, std::size_t count) {
    std::string repeated;
    if (count > repeated.max_size()) {
        throw std::length_error("RepeatChar: " + std::to_string(count) +
                                " characters exceeds the maximum string length");
    }
    repeated.assign(count, c);
    return repeated;
}

}  // namespace md_writer
