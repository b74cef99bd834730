#include "metainfo.hpp"
#include <stdexcept>
#include <fstream>
#include <iterator>
#include <cstring>
#include <openssl/sha.h>
#include "../bencode/bencode.hpp"
#include "../common/include/error.hpp"


namespace bitleech::metainfo {

    using bencode::BencodeValue;


    Sha1Digest sha1(const void* data, std::size_t len) {
        Sha1Digest out;
        SHA1(static_cast<const unsigned char*>(data), len, out.data());
        return out;
    }


    static ParseError missing(const std::string& what) {
        return ParseError(ErrorCode::MissingField, what);
    }

    static ParseError inconsistent(const std::string& what) {
        return ParseError(ErrorCode::InconsistentLength, what);
    }

    static const BencodeValue& require_key(const BencodeValue& dict, const char* key, const char* where) {
        const auto* v = dict.find(key);
        if (!v) throw missing(std::string(where) + "." + key + " missing");
        return *v;
    }

    static const std::string& require_str(const BencodeValue& dict, const char* key, const char* where) {
        const auto& v = require_key(dict, key, where);
        if (!v.isString()) throw missing(std::string(where) + "." + key + " not a string");
        return v.asString();
    }

    static int64_t require_int(const BencodeValue& dict, const char* key, const char* where) {
        const auto& v = require_key(dict, key, where);
        if (!v.isInt()) throw missing(std::string(where) + "." + key + " not an int");
        return v.asInt();
    }

    static uint64_t require_length(const BencodeValue& dict, const char* where) {
        auto len = require_int(dict, "length", where);
        if (len < 0) throw inconsistent(std::string(where) + ".length negative");
        return static_cast<uint64_t>(len);
    }

    static std::vector<Sha1Digest> split_pieces_blob(const std::string& blob) {
        if (blob.size() % 20 != 0) throw inconsistent("pieces blob not multiple of 20");

        std::vector<Sha1Digest> out;
        out.reserve(blob.size() / 20);

        for (size_t i = 0; i < blob.size(); i += 20) {
            Sha1Digest a{};
            std::memcpy(a.data(), blob.data() + i, 20);
            out.push_back(a);
        }
        return out;
    }

    static std::vector<FileEntry> single_file_entries(const BencodeValue& infoDict, const std::string& name) {
        FileEntry fe;
        fe.path = std::filesystem::path(name);
        fe.length = require_length(infoDict, "info");
        fe.offset = 0;
        return {fe};
    }

    static std::vector<FileEntry> multi_file_entries(const BencodeValue& filesv, const std::string& name) {

        if (!filesv.isList()) throw missing("info.files not a list");
        const auto& lst = filesv.asList();
        std::vector<FileEntry> out;
        out.reserve(lst.size());
        uint64_t running = 0;

        for (const auto& fd : lst) {
            if (!fd.isDict()) throw missing("file entry not a dict");

            uint64_t len = require_length(fd, "file");

            const auto& pathv = require_key(fd, "path", "file");
            if (!pathv.isList() || pathv.asList().empty()) throw missing("file.path missing or empty");

            std::filesystem::path p(name);
            for (const auto& segv : pathv.asList()) {
                if (!segv.isString()) throw missing("file.path segment not a string");
                p /= segv.asString();
            }

            FileEntry fe;
            fe.path = std::move(p);
            fe.length = len;
            fe.offset = running;
            running += len;
            out.push_back(std::move(fe));
        }

        return out;
    }

    static std::vector<std::vector<std::string>> collect_tracker_tiers(const BencodeValue& root) {
        std::vector<std::vector<std::string>> tiers;

        const auto* al = root.find("announce-list");
        if (al && al->isList()) {
            // BEP 12: announce-list is a list of lists of strings
            for (const auto& tierVal : al->asList()) {
                if (!tierVal.isList()) continue;
                std::vector<std::string> tier;
                for (const auto& s : tierVal.asList()) {
                    if (s.isString()) tier.push_back(s.asString());
                }
                if (!tier.empty()) tiers.push_back(std::move(tier));
            }
        }

        return tiers;
    }


    static InfoDictionary decode_info_dict(const BencodeValue& info, std::string_view infoSlice) {

        if (!info.isDict()) throw missing("info not a dict");

        InfoDictionary out;
        out.rawInfo.assign(infoSlice.data(), infoSlice.size());
        out.name = require_str(info, "name", "info");

        auto pl = require_int(info, "piece length", "info");
        if (pl <= 0 || pl > int64_t(UINT32_MAX)) throw inconsistent("info.piece length out of range");
        out.pieceLength = static_cast<uint32_t>(pl);

        out.pieces = split_pieces_blob(require_str(info, "pieces", "info"));

        if (const auto* filesv = info.find("files")) {
            out.files = multi_file_entries(*filesv, out.name);
            out.multiFile = true;
        } else {
            out.files = single_file_entries(info, out.name);
        }

        return out;
    }

    // -------------------------- Public API ---------------------------

    Metainfo Metainfo::fromTorrent(std::string_view data) {

        auto pr = bencode::BencodeParser::parseWithInfoSlice(data);
        const auto& root = pr.root;
        if (!root.isDict()) throw ParseError(ErrorCode::MalformedBencode, "torrent root is not a dict");

        Metainfo mi;
        mi.announce_ = require_str(root, "announce", "root");

        const auto& info = require_key(root, "info", "root");
        if (!pr.slice) throw missing("root.info missing");
        mi.info_ = decode_info_dict(info, *pr.slice);
        mi.announceList_ = collect_tracker_tiers(root);

        for (const auto& f : mi.info_.files) mi.totalLength_ += f.length;

        // The piece table must cover the content exactly: ceil(total / pieceLength) entries.
        const uint64_t expected = (mi.totalLength_ + mi.info_.pieceLength - 1) / mi.info_.pieceLength;
        if (expected != mi.info_.pieces.size()) {
            throw inconsistent("piece table has " + std::to_string(mi.info_.pieces.size()) +
                               " entries, file lengths need " + std::to_string(expected));
        }

        // Hash the info dictionary exactly as it appeared in the file
        mi.infoHash_.bytes = sha1(mi.info_.rawInfo.data(), mi.info_.rawInfo.size());

        return mi;
    }

    Metainfo Metainfo::fromFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) throw ParseError(ErrorCode::MetainfoIo, "failed to open " + path.string());

        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) throw ParseError(ErrorCode::MetainfoIo, "failed to read " + path.string());

        return fromTorrent(data);
    }

    const Sha1Digest& Metainfo::pieceHash(std::size_t index) const {
        if (index >= info_.pieces.size()) throw std::out_of_range("piece index " + std::to_string(index));
        return info_.pieces[index];
    }

    uint32_t Metainfo::lastPieceLength() const noexcept {
        if (info_.pieces.empty()) return 0;
        const uint64_t rem = totalLength_ - uint64_t(info_.pieces.size() - 1) * info_.pieceLength;
        return rem == 0 ? info_.pieceLength : static_cast<uint32_t>(rem);
    }

    uint32_t Metainfo::pieceSize(std::size_t index) const {
        if (index >= info_.pieces.size()) throw std::out_of_range("piece index " + std::to_string(index));
        return index + 1 == info_.pieces.size() ? lastPieceLength() : info_.pieceLength;
    }

} // namespace bitleech::metainfo
