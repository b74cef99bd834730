#include <algorithm>
#include <charconv>
#include <cstring>
#include <limits>
#include <random>
#include <sstream>
#include "config.hpp"


namespace bitleech::config {

    static constexpr char kPeerIdPrefix[] = "-BL0001-";


    std::optional<logger::LogLevel> parseLogLevel(const std::string& s) {
        using logger::LogLevel;
        if (s == "trace") return LogLevel::trace;
        if (s == "debug") return LogLevel::debug;
        if (s == "info")  return LogLevel::info;
        if (s == "warn")  return LogLevel::warn;
        if (s == "error") return LogLevel::error;
        if (s == "none")  return LogLevel::none;
        return std::nullopt;
    }


    PeerID generatePeerId() {
        static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
        std::random_device rand_dev;
        std::uniform_int_distribution<std::size_t> dist(0, sizeof(alphabet) - 2);

        PeerID id;
        std::size_t n = std::strlen(kPeerIdPrefix);
        std::copy_n(kPeerIdPrefix, n, id.bytes.begin());
        for (std::size_t i = n; i < id.bytes.size(); ++i) {
            id.bytes[i] = static_cast<std::uint8_t>(alphabet[dist(rand_dev)]);
        }
        return id;
    }


    namespace {

        Expected<ClientConfig> invalid(const std::string& msg) {
            return Expected<ClientConfig>::failure(ErrorCode::InvalidConfig, msg);
        }

        template <typename T>
        bool parseNumber(const std::string& s, T& out) {
            if (s.empty()) return false;
            auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc{} && p == s.data() + s.size();
        }

        bool parseBool(const std::string& s, bool& out) {
            if (s == "true" || s == "1" || s == "yes") { out = true; return true; }
            if (s == "false" || s == "0" || s == "no") { out = false; return true; }
            return false;
        }

        template <typename Rep, typename Period>
        bool parseDuration(const std::string& s, std::chrono::duration<Rep, Period>& out) {
            Rep n{};
            if (!parseNumber(s, n)) return false;
            out = std::chrono::duration<Rep, Period>(n);
            return true;
        }

        // Applies one --key=value; returns an error message or empty.
        std::string apply(ClientConfig& c, const std::string& key, const std::string& val) {
            auto bad = [&] { return "bad value for --" + key + ": '" + val + "'"; };

            if (key == "block-size")         return parseNumber(val, c.blockSize) ? "" : bad();
            if (key == "max-connections")    return parseNumber(val, c.maxConnections) ? "" : bad();
            if (key == "window")             return parseNumber(val, c.window) ? "" : bad();
            if (key == "request-timeout")    return parseDuration(val, c.requestTimeout) ? "" : bad();
            if (key == "idle-timeout")       return parseDuration(val, c.idleTimeout) ? "" : bad();
            if (key == "keepalive")          return parseDuration(val, c.keepAlive) ? "" : bad();
            if (key == "connect-timeout")    return parseDuration(val, c.connectTimeout) ? "" : bad();
            if (key == "tick-ms")            return parseDuration(val, c.tickInterval) ? "" : bad();
            if (key == "retry-backoff")      return parseDuration(val, c.retryBackoff) ? "" : bad();
            if (key == "max-backoff")        return parseDuration(val, c.maxBackoff) ? "" : bad();
            if (key == "max-peer-retries")   return parseNumber(val, c.maxPeerRetries) ? "" : bad();
            if (key == "offload-hashing")    return parseBool(val, c.offloadHashing) ? "" : bad();
            if (key == "hash-threads")       return parseNumber(val, c.hashThreads) ? "" : bad();
            if (key == "buffer-pieces")      return parseBool(val, c.bufferPiecesInMemory) ? "" : bad();
            if (key == "port")               return parseNumber(val, c.port) ? "" : bad();
            if (key == "numwant")            return parseNumber(val, c.numwant) ? "" : bad();
            if (key == "progress-interval")  return parseDuration(val, c.progressInterval) ? "" : bad();
            if (key == "output-dir")         { c.outputDir = val; return val.empty() ? bad() : ""; }
            if (key == "log-file")           { c.logFile = val; return ""; }

            if (key == "corrupt-threshold") {
                std::size_t n{};
                if (!parseNumber(val, n)) return bad();
                c.corruptThreshold = n;
                return "";
            }
            if (key == "file-layout") {
                if (val == "globalOffset") c.fileLayout = piece::FileLayout::globalOffset;
                else if (val == "pieceFiles") c.fileLayout = piece::FileLayout::pieceFiles;
                else return bad();
                return "";
            }
            if (key == "log-level") {
                auto lvl = parseLogLevel(val);
                if (!lvl) return bad();
                c.logLevel = *lvl;
                return "";
            }
            if (key == "peer-id") {
                if (val.size() != 20) return "--peer-id must be exactly 20 bytes";
                PeerID id;
                std::copy(val.begin(), val.end(), id.bytes.begin());
                c.peerId = id;
                return "";
            }
            return "unknown option --" + key;
        }

    } // namespace


    Expected<ClientConfig> parseArgs(const std::vector<std::string>& args) {
        ClientConfig c;
        if (args.size() < 2) return invalid("missing torrent file");

        for (std::size_t i = 1; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a.rfind("--", 0) != 0) {
                if (!c.torrentPath.empty()) return invalid("unexpected argument '" + a + "'");
                c.torrentPath = a;
                continue;
            }
            auto eq = a.find('=');
            if (eq == std::string::npos) return invalid("expected --key=value, got '" + a + "'");
            auto err = apply(c, a.substr(2, eq - 2), a.substr(eq + 1));
            if (!err.empty()) return invalid(err);
        }
        if (c.torrentPath.empty()) return invalid("missing torrent file");

        if (auto v = validate(c); !v) return Expected<ClientConfig>::failure(*v.error);
        return Expected<ClientConfig>::success(std::move(c));
    }


    Expected<ClientConfig> parseArgs(int argc, const char* const* argv) {
        std::vector<std::string> args;
        args.reserve(static_cast<std::size_t>(std::max(argc, 0)));
        for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);
        return parseArgs(args);
    }


    Expected<void> validate(const ClientConfig& c) {
        auto fail = [](const std::string& m) { return Expected<void>::failure(ErrorCode::InvalidConfig, m); };

        // peers drop requests above 16 KiB; some accept up to 128 KiB
        if (c.blockSize == 0 || c.blockSize > 131072) return fail("block-size must be in 1..131072");
        if (c.maxConnections == 0) return fail("max-connections must be at least 1");
        if (c.window == 0) return fail("window must be at least 1");
        if (c.requestTimeout.count() <= 0 || c.idleTimeout.count() <= 0 ||
            c.keepAlive.count() <= 0 || c.connectTimeout.count() <= 0) {
            return fail("timeouts must be positive");
        }
        if (c.keepAlive >= c.idleTimeout) return fail("keepalive must be shorter than idle-timeout");
        if (c.tickInterval.count() <= 0) return fail("tick-ms must be positive");
        if (c.retryBackoff.count() <= 0 || c.maxBackoff < c.retryBackoff) {
            return fail("retry-backoff must be positive and not above max-backoff");
        }
        if (c.corruptThreshold && *c.corruptThreshold == 0) return fail("corrupt-threshold must be at least 1");
        if (c.offloadHashing && c.hashThreads == 0) return fail("hash-threads must be at least 1");
        if (c.port == 0) return fail("port must be in 1..65535");
        if (c.progressInterval.count() <= 0) return fail("progress-interval must be positive");
        return Expected<void>::success();
    }


    std::string usage(const std::string& prog) {
        std::ostringstream os;
        os << "Usage: " << prog << " <file.torrent> [--key=value ...]\n"
           << "  --output-dir=DIR          (.)\n"
           << "  --file-layout=globalOffset|pieceFiles\n"
           << "  --block-size=N            (16384)\n"
           << "  --max-connections=N       (10)\n"
           << "  --window=N                (5)\n"
           << "  --request-timeout=S       (30)\n"
           << "  --idle-timeout=S          (120)\n"
           << "  --keepalive=S             (90)\n"
           << "  --connect-timeout=S       (10)\n"
           << "  --tick-ms=MS              (1000)\n"
           << "  --retry-backoff=S         (5)\n"
           << "  --max-backoff=S           (300)\n"
           << "  --max-peer-retries=N      (5)\n"
           << "  --corrupt-threshold=N     (max-connections)\n"
           << "  --offload-hashing=BOOL    (false)\n"
           << "  --hash-threads=N          (2)\n"
           << "  --buffer-pieces=BOOL      (true)\n"
           << "  --peer-id=20BYTES         (random -BL0001-)\n"
           << "  --port=N                  (6881)\n"
           << "  --numwant=N               (50)\n"
           << "  --log-level=trace|debug|info|warn|error|none\n"
           << "  --log-file=PATH\n"
           << "  --progress-interval=S     (10)\n";
        return os.str();
    }

} // namespace bitleech::config
