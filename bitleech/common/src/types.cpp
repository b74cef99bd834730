#include <sstream>
#include <iomanip>
#include "../include/types.hpp"


namespace bitleech {


    std::string toHex(const std::uint8_t* data, std::size_t len) {
        std::ostringstream oss;
        for (std::size_t i = 0; i < len; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
        }
        return oss.str();
    }


    std::string InfoHash::toHex() const {
        return bitleech::toHex(bytes.data(), bytes.size());
    }


    std::string PeerAddr::toString() const {
        if (ip.find(':') != std::string::npos) return "[" + ip + "]:" + std::to_string(port);
        return ip + ":" + std::to_string(port);
    }


} // namespace bitleech
