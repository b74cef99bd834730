#include <stdexcept>
#include "../include/bitfield.hpp"


namespace bitleech::wire {

    Bitfield::Bitfield(std::size_t pieceCount) : bits_(pieceCount, false) {}


    Expected<Bitfield> Bitfield::fromBytes(std::span<const std::uint8_t> bytes, std::size_t pieceCount) {
        const std::size_t expected = (pieceCount + 7) / 8;
        if (bytes.size() != expected) {
            return Expected<Bitfield>::failure(ErrorCode::BitfieldOutOfRange,
                "bitfield is " + std::to_string(bytes.size()) + " bytes, expected " + std::to_string(expected));
        }

        Bitfield bf(pieceCount);
        for (std::size_t byte = 0; byte < bytes.size(); ++byte) {
            for (int bit = 0; bit < 8; ++bit) {
                if (!(bytes[byte] & (0x80u >> bit))) continue;

                const std::size_t index = byte * 8 + bit;
                if (index >= pieceCount) {
                    return Expected<Bitfield>::failure(ErrorCode::BitfieldOutOfRange,
                        "padding bit " + std::to_string(index) + " set with " + std::to_string(pieceCount) + " pieces");
                }
                bf.set(index);
            }
        }
        return Expected<Bitfield>::success(std::move(bf));
    }


    bool Bitfield::has(std::size_t index) const noexcept {
        return index < bits_.size() && bits_[index];
    }


    void Bitfield::set(std::size_t index) {
        if (index >= bits_.size()) throw std::out_of_range("bitfield index");
        if (!bits_[index]) {
            bits_[index] = true;
            ++count_;
        }
    }


    Bytes Bitfield::toBytes() const {
        Bytes out((bits_.size() + 7) / 8, 0);
        for (std::size_t i = 0; i < bits_.size(); ++i) {
            if (bits_[i]) out[i / 8] |= static_cast<std::uint8_t>(0x80u >> (i % 8));
        }
        return out;
    }


    std::vector<std::size_t> Bitfield::indices() const {
        std::vector<std::size_t> out;
        out.reserve(count_);
        for (std::size_t i = 0; i < bits_.size(); ++i) if (bits_[i]) out.push_back(i);
        return out;
    }

} // namespace bitleech::wire
