#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "../../common/include/expected.hpp"
#include "../../common/include/types.hpp"


namespace bitleech::wire {

    // Set of piece indices a peer advertises. Bit order on the wire is MSB-first:
    // bit 7 of byte 0 is piece 0.
    class Bitfield 
    {
    public:
        Bitfield() = default;
        explicit Bitfield(std::size_t pieceCount);

        // BitfieldOutOfRange when the byte count is not ceil(pieceCount / 8) or a
        // padding bit past pieceCount is set.
        static Expected<Bitfield> fromBytes(std::span<const std::uint8_t> bytes, std::size_t pieceCount);

        bool has(std::size_t index) const noexcept;
        void set(std::size_t index);

        std::size_t size() const noexcept { return bits_.size(); }
        std::size_t count() const noexcept { return count_; }
        bool all() const noexcept { return count_ == bits_.size(); }
        bool none() const noexcept { return count_ == 0; }

        Bytes toBytes() const;
        std::vector<std::size_t> indices() const;

        bool operator==(const Bitfield&) const = default;

    private:
        std::vector<bool> bits_;
        std::size_t count_{0};
    };

} // namespace bitleech::wire
