#include "utf8.hpp"

namespace GameLogic {

namespace {

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Длина последовательности по первому байту, 0 для недопустимого байта
std::size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

} // namespace

std::size_t Utf8::length(const std::string& text) {
    std::size_t count = 0;
    for (char c : text) {
        if (!is_continuation(static_cast<unsigned char>(c))) {
            count++;
        }
    }
    return count;
}

void Utf8::pop_back(std::string& text) {
    while (!text.empty()) {
        unsigned char last = static_cast<unsigned char>(text.back());
        text.pop_back();
        if (!is_continuation(last)) {
            break;
        }
    }
}

std::string Utf8::sanitize(const std::string& bytes) {
    std::string result;
    result.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        std::size_t len = sequence_length(lead);

        bool valid = len > 0 && i + len <= bytes.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            valid = is_continuation(static_cast<unsigned char>(bytes[i + k]));
        }

        if (valid) {
            result.append(bytes, i, len);
            i += len;
        } else {
            // Битый байт просто выбрасываем
            i++;
        }
    }

    return result;
}

std::uint32_t Utf8::first_code_point(const std::string& text) {
    if (text.empty()) return 0;

    unsigned char lead = static_cast<unsigned char>(text[0]);
    std::size_t len = sequence_length(lead);
    if (len == 0 || len > text.size()) return 0;
    if (len == 1) return lead;

    static const unsigned char LEAD_MASKS[] = {0, 0, 0x1F, 0x0F, 0x07};
    std::uint32_t code_point = lead & LEAD_MASKS[len];
    for (std::size_t k = 1; k < len; ++k) {
        unsigned char byte = static_cast<unsigned char>(text[k]);
        if (!is_continuation(byte)) return 0;
        code_point = (code_point << 6) | (byte & 0x3F);
    }
    return code_point;
}

} // namespace GameLogic
