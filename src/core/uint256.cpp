#include "uint256.hpp"
#include "crypto.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcash {

U256::U256(uint64_t value) {
    data_.fill(0);
    for (size_t i = 0; i < 8; ++i) {
        data_[WIDTH - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

U256 U256::from_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > WIDTH * 2) {
        throw std::invalid_argument("U256: hex string must hold 1 to 64 digits");
    }

    U256 out;
    // Fill from the least significant end so short strings are left-padded.
    size_t pos = WIDTH * 2;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int nib = PCashCrypto::hex_nibble(*it);
        if (nib < 0) {
            throw std::invalid_argument("U256: invalid hex digit '" + std::string(1, *it) + "'");
        }
        --pos;
        uint8_t& byte = out.data_[pos / 2];
        if (pos % 2 == 0) {
            byte |= static_cast<uint8_t>(nib << 4);
        } else {
            byte |= static_cast<uint8_t>(nib);
        }
    }
    return out;
}

U256 U256::from_dec(const std::string& dec) {
    if (dec.empty()) {
        throw std::invalid_argument("U256: empty decimal string");
    }

    U256 out;
    for (char c : dec) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("U256: invalid decimal digit '" + std::string(1, c) + "'");
        }
        // out = out * 10 + digit
        unsigned int carry = static_cast<unsigned int>(c - '0');
        for (size_t i = WIDTH; i-- > 0;) {
            unsigned int v = static_cast<unsigned int>(out.data_[i]) * 10 + carry;
            out.data_[i] = static_cast<uint8_t>(v & 0xff);
            carry = v >> 8;
        }
        if (carry != 0) {
            throw std::out_of_range("U256: decimal value exceeds 256 bits");
        }
    }
    return out;
}

std::string U256::to_hex() const {
    return "0x" + PCashCrypto::to_hex(data_.data(), WIDTH);
}

std::string U256::to_dec() const {
    if (is_zero()) return "0";

    Bytes work = data_;
    std::string out;
    bool nonzero = true;
    while (nonzero) {
        // work = work / 10, collecting the remainder
        unsigned int rem = 0;
        nonzero = false;
        for (size_t i = 0; i < WIDTH; ++i) {
            unsigned int cur = (rem << 8) | work[i];
            work[i] = static_cast<uint8_t>(cur / 10);
            rem = cur % 10;
            if (work[i] != 0) nonzero = true;
        }
        out += static_cast<char>('0' + rem);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

bool U256::is_zero() const {
    for (uint8_t b : data_) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace pcash
