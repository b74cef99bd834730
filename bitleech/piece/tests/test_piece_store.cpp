#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

#include "../include/piece_store.hpp"
#include "../../metainfo/tests/torrent_builder.hpp"

using namespace bitleech;
using namespace bitleech::piece;
namespace fs = std::filesystem;

namespace {

    struct TempDir {
        fs::path path;
        TempDir() {
            std::random_device rd;
            path = fs::temp_directory_path() / ("bitleech_store_" + std::to_string(rd()));
            fs::create_directories(path);
        }
        ~TempDir() { std::error_code ec; fs::remove_all(path, ec); }
    };

    std::string slurp(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), {});
    }

    std::span<const std::uint8_t> bytesOf(const std::string& s, std::size_t off, std::size_t len) {
        return { reinterpret_cast<const std::uint8_t*>(s.data()) + off, len };
    }

    // three files of 10, 25 and 5 bytes under "album", pieces of 16 bytes
    struct MultiFile {
        std::string content = testing::makePayload(40, 7);
        metainfo::Metainfo mi;

        MultiFile() : mi(build()) {}

        metainfo::Metainfo build() const {
            testing::TorrentBuilder tb;
            tb.name = "album";
            tb.pieceLength = 16;
            tb.content = content;
            tb.files = { {{"a.bin"}, 10}, {{"sub", "b.bin"}, 25}, {{"c.bin"}, 5} };
            return tb.metainfo();
        }
    };

} // namespace


TEST_CASE("path validation rejects escapes") {
    CHECK(isSafeRelativePath("album/sub/b.bin"));
    CHECK_FALSE(isSafeRelativePath("album/../../etc/passwd"));
    CHECK_FALSE(isSafeRelativePath("/etc/passwd"));
    CHECK_FALSE(isSafeRelativePath("album/./x"));
    CHECK_FALSE(isSafeRelativePath("album/"));
    CHECK_FALSE(isSafeRelativePath(""));
}

TEST_CASE("global offsets map pieces across file boundaries") {
    TempDir dir;
    MultiFile t;

    auto opened = FilePieceStore::open(dir.path, t.mi.files(), PieceLayout::fromMetainfo(t.mi), FileLayout::globalOffset);
    REQUIRE(opened.has_value());
    auto& store = *opened.get();

    CHECK(fs::file_size(dir.path / "album" / "a.bin") == 10);
    CHECK(fs::file_size(dir.path / "album" / "sub" / "b.bin") == 25);

    // out of order on purpose
    REQUIRE(store.write(2, 0, bytesOf(t.content, 32, 8)).has_value());
    REQUIRE(store.write(0, 0, bytesOf(t.content, 0, 16)).has_value());
    REQUIRE(store.write(1, 8, bytesOf(t.content, 24, 8)).has_value());
    REQUIRE(store.write(1, 0, bytesOf(t.content, 16, 8)).has_value());

    CHECK(slurp(dir.path / "album" / "a.bin") == t.content.substr(0, 10));
    CHECK(slurp(dir.path / "album" / "sub" / "b.bin") == t.content.substr(10, 25));
    CHECK(slurp(dir.path / "album" / "c.bin") == t.content.substr(35, 5));

    auto p0 = store.read(0);
    REQUIRE(p0.has_value());
    CHECK(std::string(p0.get().begin(), p0.get().end()) == t.content.substr(0, 16));

    REQUIRE(store.finalize().has_value());
}

TEST_CASE("piece files keep one file per piece") {
    TempDir dir;
    MultiFile t;

    auto opened = FilePieceStore::open(dir.path / "parts", t.mi.files(), PieceLayout::fromMetainfo(t.mi), FileLayout::pieceFiles);
    REQUIRE(opened.has_value());
    auto& store = *opened.get();

    REQUIRE(store.write(1, 8, bytesOf(t.content, 24, 8)).has_value());
    REQUIRE(store.write(1, 0, bytesOf(t.content, 16, 8)).has_value());

    CHECK(slurp(store.piecePath(1)) == t.content.substr(16, 16));
    auto r = store.read(1);
    REQUIRE(r.has_value());
    CHECK(r.get().size() == 16);

    auto missing = store.read(0);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error->code == ErrorCode::StorageFailure);
}

TEST_CASE("file handles are opened once per file and released by finalize") {
    TempDir dir;
    MultiFile t;

    auto opened = FilePieceStore::open(dir.path, t.mi.files(), PieceLayout::fromMetainfo(t.mi), FileLayout::globalOffset);
    REQUIRE(opened.has_value());
    auto& store = *opened.get();
    CHECK(store.openHandles() == 0);

    // two-byte blocks, so every file is written many times
    for (std::uint32_t piece = 0; piece < 3; ++piece) {
        const std::uint32_t size = piece == 2 ? 8 : 16;
        for (std::uint32_t off = 0; off < size; off += 2) {
            REQUIRE(store.write(piece, off, bytesOf(t.content, piece * 16 + off, 2)).has_value());
        }
    }
    CHECK(store.openHandles() == 3);

    auto p1 = store.read(1);
    REQUIRE(p1.has_value());
    CHECK(std::string(p1.get().begin(), p1.get().end()) == t.content.substr(16, 16));
    CHECK(store.openHandles() == 3);

    REQUIRE(store.finalize().has_value());
    CHECK(store.openHandles() == 0);
    CHECK(slurp(dir.path / "album" / "sub" / "b.bin") == t.content.substr(10, 25));

    // a later write reopens what it needs
    REQUIRE(store.write(2, 4, bytesOf(t.content, 36, 4)).has_value());
    CHECK(store.openHandles() == 1);
    CHECK(slurp(dir.path / "album" / "c.bin") == t.content.substr(35, 5));
}

TEST_CASE("reading a piece file that was never written does not create it") {
    TempDir dir;
    MultiFile t;

    auto opened = FilePieceStore::open(dir.path, t.mi.files(), PieceLayout::fromMetainfo(t.mi), FileLayout::pieceFiles);
    REQUIRE(opened.has_value());
    auto& store = *opened.get();

    CHECK_FALSE(store.read(2).has_value());
    CHECK_FALSE(fs::exists(store.piecePath(2)));
    CHECK(store.openHandles() == 0);
}

TEST_CASE("writes outside a piece are refused") {
    TempDir dir;
    MultiFile t;
    auto opened = FilePieceStore::open(dir.path, t.mi.files(), PieceLayout::fromMetainfo(t.mi), FileLayout::globalOffset);
    REQUIRE(opened.has_value());

    auto r = opened.get()->write(2, 4, bytesOf(t.content, 0, 8));   // last piece is 8 bytes
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->code == ErrorCode::StorageFailure);
}

TEST_CASE("torrents with unsafe paths cannot open a file store") {
    TempDir dir;
    std::vector<metainfo::FileEntry> files{ {fs::path("album") / ".." / ".." / "escape", 4, 0} };
    PieceLayout layout{16, 4, {Sha1Digest{}}};

    auto r = FilePieceStore::open(dir.path, files, layout, FileLayout::globalOffset);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->code == ErrorCode::StorageFailure);
}

TEST_CASE("memory store reads back what was written") {
    PieceLayout layout{4, 6, {Sha1Digest{}, Sha1Digest{}}};
    MemoryPieceStore store(layout);
    const std::string data = "abcdef";

    REQUIRE(store.write(1, 0, bytesOf(data, 4, 2)).has_value());
    REQUIRE(store.write(0, 0, bytesOf(data, 0, 4)).has_value());
    CHECK_FALSE(store.write(1, 1, bytesOf(data, 0, 2)).has_value());

    auto r = store.read(1);
    REQUIRE(r.has_value());
    CHECK(r.get() == Bytes{'e', 'f'});
    CHECK(store.writes() == 2);
}
