#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace placement::utils {

/**
 * @brief Генератор идентификаторов корзин, позиций, заказов и событий
 *
 * Thread-safe: у каждого потока свой генератор.
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y из [8, 9, a, b]
     */
    static std::string generate() {
        std::array<uint8_t, 16> bytes = randomBytes<16>();
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        std::string result;
        result.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                result += '-';
            }
            appendHex(result, bytes[i]);
        }
        return result;
    }

    /**
     * @brief Короткий случайный hex-идентификатор (для correlation id)
     */
    static std::string shortId() {
        std::string result;
        for (uint8_t byte : randomBytes<4>()) {
            appendHex(result, byte);
        }
        return result;
    }

private:
    template <size_t N>
    static std::array<uint8_t, N> randomBytes() {
        thread_local std::mt19937 engine(std::random_device{}());
        std::uniform_int_distribution<int> dist(0, 255);

        std::array<uint8_t, N> bytes{};
        for (auto& byte : bytes) {
            byte = static_cast<uint8_t>(dist(engine));
        }
        return bytes;
    }

    static void appendHex(std::string& out, uint8_t byte) {
        static const char digits[] = "0123456789abcdef";
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    }
};

} // namespace placement::utils
