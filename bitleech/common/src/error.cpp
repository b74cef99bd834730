#include "../include/error.hpp"


namespace bitleech {

    const char* toString(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::MalformedBencode:   return "MalformedBencode";
            case ErrorCode::MissingField:       return "MissingField";
            case ErrorCode::InconsistentLength: return "InconsistentLength";
            case ErrorCode::MetainfoIo:         return "MetainfoIo";
            case ErrorCode::HandshakeMalformed: return "HandshakeMalformed";
            case ErrorCode::InfoHashMismatch:   return "InfoHashMismatch";
            case ErrorCode::UnknownMessageId:   return "UnknownMessageId";
            case ErrorCode::MessageMalformed:   return "MessageMalformed";
            case ErrorCode::BitfieldOutOfRange: return "BitfieldOutOfRange";
            case ErrorCode::ProtocolViolation:  return "ProtocolViolation";
            case ErrorCode::UnexpectedPiece:    return "UnexpectedPiece";
            case ErrorCode::TransportError:     return "TransportError";
            case ErrorCode::PeerStalled:        return "PeerStalled";
            case ErrorCode::PeerTimeout:        return "PeerTimeout";
            case ErrorCode::NoMutualWork:       return "NoMutualWork";
            case ErrorCode::PieceHashMismatch:  return "PieceHashMismatch";
            case ErrorCode::StorageFailure:     return "StorageFailure";
            case ErrorCode::SwarmCorrupt:       return "SwarmCorrupt";
            case ErrorCode::SwarmExhausted:     return "SwarmExhausted";
            case ErrorCode::TrackerUnreachable: return "TrackerUnreachable";
            case ErrorCode::TrackerMalformed:   return "TrackerMalformed";
            case ErrorCode::TrackerFailure:     return "TrackerFailure";
            case ErrorCode::InvalidConfig:      return "InvalidConfig";
        }
        return "Unknown";
    }


    bool isFatalForPeer(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::HandshakeMalformed:
            case ErrorCode::InfoHashMismatch:
            case ErrorCode::UnknownMessageId:
            case ErrorCode::MessageMalformed:
            case ErrorCode::BitfieldOutOfRange:
            case ErrorCode::ProtocolViolation:
            case ErrorCode::UnexpectedPiece:
                return true;
            default:
                return false;
        }
    }

} // namespace bitleech
