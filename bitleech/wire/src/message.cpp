#include <algorithm>
#include <type_traits>
#include "../include/message.hpp"


namespace bitleech::wire {

    namespace {

        void putU32(Bytes& out, std::uint32_t v) {
            out.push_back(static_cast<std::uint8_t>(v >> 24));
            out.push_back(static_cast<std::uint8_t>(v >> 16));
            out.push_back(static_cast<std::uint8_t>(v >> 8));
            out.push_back(static_cast<std::uint8_t>(v));
        }

        std::uint32_t getU32(const std::uint8_t* p) {
            return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) | (std::uint32_t(p[2]) << 8) | std::uint32_t(p[3]);
        }

        Bytes frame(MessageId id, std::size_t payloadLen) {
            Bytes out;
            out.reserve(kLengthPrefix + 1 + payloadLen);
            putU32(out, static_cast<std::uint32_t>(1 + payloadLen));
            out.push_back(static_cast<std::uint8_t>(id));
            return out;
        }

        Expected<Message> malformed(const char* what, std::size_t got) {
            return Expected<Message>::failure(ErrorCode::MessageMalformed,
                std::string(what) + " payload of " + std::to_string(got) + " bytes");
        }

        template <typename Triple>
        Expected<Message> decodeTriple(std::span<const std::uint8_t> payload, const char* what) {
            if (payload.size() != 12) return malformed(what, payload.size());
            Triple t;
            t.index = getU32(payload.data());
            t.begin = getU32(payload.data() + 4);
            t.length = getU32(payload.data() + 8);
            return Expected<Message>::success(t);
        }

        template <typename T>
        Expected<Message> bare(std::span<const std::uint8_t> payload, const char* what) {
            if (!payload.empty()) return malformed(what, payload.size());
            return Expected<Message>::success(T{});
        }

    } // anonymous namespace


    const char* messageName(const Message& m) noexcept {
        static constexpr const char* names[] = {
            "keep-alive", "choke", "unchoke", "interested", "not interested",
            "have", "bitfield", "request", "piece", "cancel"
        };
        return names[m.index()];
    }


    Bytes encode(const Message& m) {
        return std::visit([](auto const& msg) -> Bytes {
            using T = std::decay_t<decltype(msg)>;

            if constexpr (std::is_same_v<T, KeepAlive>) {
                return Bytes(kLengthPrefix, 0);
            } else if constexpr (std::is_same_v<T, Choke>) {
                return frame(MessageId::choke, 0);
            } else if constexpr (std::is_same_v<T, Unchoke>) {
                return frame(MessageId::unchoke, 0);
            } else if constexpr (std::is_same_v<T, Interested>) {
                return frame(MessageId::interested, 0);
            } else if constexpr (std::is_same_v<T, NotInterested>) {
                return frame(MessageId::not_interested, 0);
            } else if constexpr (std::is_same_v<T, Have>) {
                auto out = frame(MessageId::have, 4);
                putU32(out, msg.index);
                return out;
            } else if constexpr (std::is_same_v<T, BitfieldMsg>) {
                auto out = frame(MessageId::bitfield, msg.bits.size());
                out.insert(out.end(), msg.bits.begin(), msg.bits.end());
                return out;
            } else if constexpr (std::is_same_v<T, PieceMsg>) {
                auto out = frame(MessageId::piece, 8 + msg.block.size());
                putU32(out, msg.index);
                putU32(out, msg.begin);
                out.insert(out.end(), msg.block.begin(), msg.block.end());
                return out;
            } else {
                // Request and Cancel share a layout
                auto out = frame(std::is_same_v<T, Request> ? MessageId::request : MessageId::cancel, 12);
                putU32(out, msg.index);
                putU32(out, msg.begin);
                putU32(out, msg.length);
                return out;
            }
        }, m);
    }


    std::uint32_t readLengthPrefix(std::span<const std::uint8_t, kLengthPrefix> prefix) noexcept {
        return getU32(prefix.data());
    }


    std::uint32_t maxFrameLength(std::uint32_t blockSize, std::size_t pieceCount) noexcept {
        const std::size_t pieceFrame = std::size_t(blockSize) + 13;
        const std::size_t bitfieldFrame = 1 + (pieceCount + 7) / 8;
        return static_cast<std::uint32_t>(std::max(pieceFrame, bitfieldFrame));
    }


    Expected<Message> decode(std::span<const std::uint8_t> frame) {
        if (frame.size() < kLengthPrefix) {
            return Expected<Message>::failure(ErrorCode::MessageMalformed, "frame shorter than its length prefix");
        }
        const std::uint32_t len = getU32(frame.data());
        const std::size_t available = frame.size() - kLengthPrefix;
        if (len != available) {
            return Expected<Message>::failure(ErrorCode::MessageMalformed,
                "length prefix " + std::to_string(len) + " but " + std::to_string(available) + " bytes follow");
        }
        return decodePayload(frame.subspan(kLengthPrefix));
    }


    Expected<Message> decodePayload(std::span<const std::uint8_t> body) {
        if (body.empty()) return Expected<Message>::success(KeepAlive{});

        const std::uint8_t id = body[0];
        auto payload = body.subspan(1);

        switch (static_cast<MessageId>(id)) {
            case MessageId::choke:          return bare<Choke>(payload, "choke");
            case MessageId::unchoke:        return bare<Unchoke>(payload, "unchoke");
            case MessageId::interested:     return bare<Interested>(payload, "interested");
            case MessageId::not_interested: return bare<NotInterested>(payload, "not interested");

            case MessageId::have: {
                if (payload.size() != 4) return malformed("have", payload.size());
                return Expected<Message>::success(Have{getU32(payload.data())});
            }
            case MessageId::bitfield:
                return Expected<Message>::success(BitfieldMsg{Bytes(payload.begin(), payload.end())});

            case MessageId::request: return decodeTriple<Request>(payload, "request");
            case MessageId::cancel:  return decodeTriple<Cancel>(payload, "cancel");

            case MessageId::piece: {
                if (payload.size() < 8) return malformed("piece", payload.size());
                PieceMsg p;
                p.index = getU32(payload.data());
                p.begin = getU32(payload.data() + 4);
                p.block.assign(payload.begin() + 8, payload.end());
                return Expected<Message>::success(std::move(p));
            }
        }

        return Expected<Message>::failure(ErrorCode::UnknownMessageId, "message id " + std::to_string(id));
    }

} // namespace bitleech::wire
