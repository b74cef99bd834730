#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <filesystem>
#include "../common/include/types.hpp"


namespace bitleech::metainfo {

    struct FileEntry 
    {
        std::filesystem::path path;     // relative; multi-file entries are rooted at the torrent name
        uint64_t length{0};
        uint64_t offset{0};             // sum of the lengths of all previous files
    };

    struct InfoDictionary 
    {
        std::string name;
        std::vector<FileEntry> files;                       // single-file => size==1
        uint32_t pieceLength{0};
        std::vector<Sha1Digest> pieces;
        std::string rawInfo;                                // exact bencoded bytes of "info"
        bool multiFile{false};
    };

    // Immutable view of a .torrent file. Both factories throw bitleech::ParseError.
    class Metainfo 
    {
    public:
        static Metainfo fromFile(const std::filesystem::path& path);
        static Metainfo fromTorrent(std::string_view data);

        const std::string& announce() const noexcept { return announce_; }
        const std::vector<std::vector<std::string>>& announceList() const noexcept { return announceList_; }

        const std::string& name() const noexcept { return info_.name; }
        const std::vector<FileEntry>& files() const noexcept { return info_.files; }
        bool isSingleFile() const noexcept { return !info_.multiFile; }

        uint32_t pieceLength() const noexcept { return info_.pieceLength; }
        std::size_t pieceCount() const noexcept { return info_.pieces.size(); }
        const std::vector<Sha1Digest>& pieces() const noexcept { return info_.pieces; }

        // Throws std::out_of_range; indices are validated against the file size at load.
        const Sha1Digest& pieceHash(std::size_t index) const;
        uint32_t pieceSize(std::size_t index) const;
        uint32_t lastPieceLength() const noexcept;
        uint64_t totalLength() const noexcept { return totalLength_; }

        const InfoHash& infoHash() const noexcept { return infoHash_; }
        const std::string& rawInfo() const noexcept { return info_.rawInfo; }

    private:
        std::string announce_;
        std::vector<std::vector<std::string>> announceList_;
        InfoDictionary info_;
        uint64_t totalLength_{0};
        InfoHash infoHash_{};
    };

    Sha1Digest sha1(const void* data, std::size_t len);

} // namespace bitleech::metainfo
