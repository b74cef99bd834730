#include <arpa/inet.h>
#include <sstream>
#include <vector>
#include <iomanip>
#include "../include/http_tracker.hpp"
#include "../include/compact_peer_codec.hpp"
#include "../../bencode/bencode.hpp"

namespace bitleech::tracker {

    HttpTracker::HttpTracker(std::shared_ptr<IHttpClient> http, HttpTrackerConfig cfg)
        : http_(std::move(http)), cfg_(cfg) {}


    std::string HttpTracker::percentEncode(std::string_view raw) 
    {
        std::ostringstream oss;
        for (unsigned char c : raw) {
            if ((c>='A'&&c<='Z')||(c>='a'&&c<='z')||(c>='0'&&c<='9')||c=='-'||c=='_'||c=='.'||c=='~') oss<<c; 
            else {
                oss<<'%'<<std::uppercase<<std::hex<<std::setw(2)<<std::setfill('0')<<(int)c<<std::nouppercase<<std::dec;
            }
        }
        return oss.str();
    }


    // Raw 20-byte values go out with every byte escaped, unreserved or not.
    std::string HttpTracker::percentEncodeBinary(const unsigned char* data, std::size_t len) {
        static const char* hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(len * 3);
        for (std::size_t i = 0; i < len; ++i) {
            out.push_back('%');
            out.push_back(hex[(data[i] >> 4) & 0xF]);
            out.push_back(hex[data[i] & 0xF]);
        }
        return out;
    }


    std::string HttpTracker::buildAnnounceUrl(const std::string& base, const AnnounceRequest& req) const 
    {
        std::ostringstream url; url << base; if (base.find('?')==std::string::npos) url<<'?'; else url<<'&';

        url << "info_hash=" << percentEncodeBinary(req.infoHash.bytes.data(), req.infoHash.bytes.size());
        url << "&peer_id=" << percentEncodeBinary(req.peerId.bytes.data(), req.peerId.bytes.size());
        url << "&port=" << req.port;
        url << "&uploaded=" << req.uploaded;
        url << "&downloaded=" << req.downloaded;
        url << "&left=" << req.left;

        if (req.event != AnnounceEvent::none) {
            url << "&event=" << eventName(req.event);
        }

        url << "&compact=" << (req.compact ? 1 : 0);
        url << "&numwant=" << req.numwant;

        if (req.trackerId) url << "&trackerid=" << percentEncode(*req.trackerId);

        return url.str();
    }


    static bool validIp(const std::string& ip) {
        unsigned char buf[16];
        return inet_pton(AF_INET, ip.c_str(), buf) == 1 || inet_pton(AF_INET6, ip.c_str(), buf) == 1;
    }


    Expected<AnnounceResponse> HttpTracker::parseAnnounceBody(const std::string& body) const 
    {
        using namespace bencode;

        BencodeValue root;
        try {
            root = BencodeParser::parse(std::string_view(body));
        } catch (const ParseError& e) {
            return Expected<AnnounceResponse>::failure(ErrorCode::TrackerMalformed, e.what());
        }

        if (!root.isDict()) return Expected<AnnounceResponse>::failure(ErrorCode::TrackerMalformed, "announce body not a dict");

        const auto& dict = root.asDict();

        if (auto it = dict.find("failure reason"); it!=dict.end() && it->second.isString()) {
            return Expected<AnnounceResponse>::failure(ErrorCode::TrackerFailure, it->second.asString());
        }


        AnnounceResponse resp;

        if (auto it = dict.find("interval"); it!=dict.end() && it->second.isInt() && it->second.asInt() >= 0) resp.interval = (std::uint32_t)it->second.asInt();
        if (auto it = dict.find("min interval"); it!=dict.end() && it->second.isInt() && it->second.asInt() >= 0) resp.minInterval = (std::uint32_t)it->second.asInt();
        if (auto it = dict.find("complete"); it!=dict.end() && it->second.isInt()) resp.complete = (std::uint32_t)it->second.asInt();
        if (auto it = dict.find("incomplete"); it!=dict.end() && it->second.isInt()) resp.incomplete = (std::uint32_t)it->second.asInt();
        if (auto it = dict.find("warning message"); it!=dict.end() && it->second.isString()) resp.warning = it->second.asString();
        if (auto it = dict.find("tracker id"); it!=dict.end() && it->second.isString()) resp.trackerId = it->second.asString();


        // Anything other than a compact string or a list of dicts is an unknown encoding: empty roster.
        if (auto it = dict.find("peers"); it!=dict.end()) {

            if (it->second.isString()) {
                const auto& s = it->second.asString();
                auto v4 = CompactPeerCodec::parseIPv4(std::string_view(s));
                resp.peers.insert(resp.peers.end(), v4.begin(), v4.end());

            } else if (it->second.isList()) {
                for (auto const& item : it->second.asList()) {
                    if (!item.isDict()) continue;
                    const auto* ipv = item.find("ip");
                    const auto* portv = item.find("port");
                    if (!ipv || !ipv->isString() || !portv || !portv->isInt()) continue;

                    auto port = portv->asInt();
                    if (port <= 0 || port > 65535 || !validIp(ipv->asString())) continue;
                    resp.peers.push_back(PeerAddr{ipv->asString(), static_cast<std::uint16_t>(port)});
                }
            }
        }

        if (auto it = dict.find("peers6"); it!=dict.end() && it->second.isString()) {
            const auto& s = it->second.asString(); auto v6 = CompactPeerCodec::parseIPv6(std::string_view(s));
            resp.peers.insert(resp.peers.end(), v6.begin(), v6.end());
        }

        return Expected<AnnounceResponse>::success(std::move(resp));
    }


    Expected<AnnounceResponse> HttpTracker::announce(const AnnounceRequest& req, const std::string& announceUrl) 
    {
        auto url = buildAnnounceUrl(announceUrl, req);
        auto resp = http_->get(url, cfg_.connectTimeoutSec, cfg_.transferTimeoutSec, cfg_.followRedirects);

        if (!resp.has_value()) return Expected<AnnounceResponse>::failure(ErrorCode::TrackerUnreachable, resp.error->message);
        return parseAnnounceBody(resp.get().body);
    }

} // namespace bitleech::tracker
