#include <algorithm>
#include <optional>
#include <system_error>
#include "../include/piece_store.hpp"


namespace bitleech::piece {

    namespace fs = std::filesystem;

    namespace {

        Expected<void> storageError(std::string msg) {
            return Expected<void>::failure(ErrorCode::StorageFailure, std::move(msg));
        }

        bool inBounds(const PieceLayout& layout, std::uint32_t piece, std::uint32_t offset, std::size_t len) {
            if (piece >= layout.pieceCount()) return false;
            return std::uint64_t(offset) + len <= layout.pieceSize(piece);
        }

    } // anonymous namespace


    const char* toString(FileLayout l) noexcept {
        return l == FileLayout::pieceFiles ? "pieceFiles" : "globalOffset";
    }


    bool isSafeRelativePath(const fs::path& p) {
        if (p.empty() || p.is_absolute() || p.has_root_name() || p.has_root_directory()) return false;
        for (auto const& part : p) {
            const auto s = part.string();
            if (s.empty() || s == "." || s == "..") return false;
        }
        return true;
    }


    // ---------------- MemoryPieceStore ----------------

    MemoryPieceStore::MemoryPieceStore(PieceLayout layout)
        : layout_(std::move(layout)), data_(layout_.totalLength, 0) {}


    Expected<void> MemoryPieceStore::write(std::uint32_t piece, std::uint32_t offset, std::span<const std::uint8_t> bytes) {
        if (!inBounds(layout_, piece, offset, bytes.size())) {
            return storageError("write outside piece " + std::to_string(piece));
        }
        std::copy(bytes.begin(), bytes.end(), data_.begin() + layout_.pieceOffset(piece) + offset);
        ++writes_;
        return Expected<void>::success();
    }


    Expected<Bytes> MemoryPieceStore::read(std::uint32_t piece) {
        if (piece >= layout_.pieceCount()) {
            return Expected<Bytes>::failure(ErrorCode::StorageFailure, "read of unknown piece " + std::to_string(piece));
        }
        auto first = data_.begin() + layout_.pieceOffset(piece);
        return Expected<Bytes>::success(Bytes(first, first + layout_.pieceSize(piece)));
    }


    Expected<void> MemoryPieceStore::finalize() {
        ++finalizeCalls_;
        return Expected<void>::success();
    }


    // ---------------- FilePieceStore ----------------

    FilePieceStore::FilePieceStore(fs::path root, std::vector<metainfo::FileEntry> files, PieceLayout layout, FileLayout mode)
        : root_(std::move(root)), files_(std::move(files)), layout_(std::move(layout)), mode_(mode) {}


    Expected<std::unique_ptr<FilePieceStore>> FilePieceStore::open(const fs::path& root,
        const std::vector<metainfo::FileEntry>& files, PieceLayout layout, FileLayout mode)
    {
        using Result = Expected<std::unique_ptr<FilePieceStore>>;

        for (auto const& f : files) {
            if (!isSafeRelativePath(f.path)) {
                return Result::failure(ErrorCode::StorageFailure, "unsafe path in torrent: " + f.path.string());
            }
        }

        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec) return Result::failure(ErrorCode::StorageFailure, "cannot create " + root.string() + ": " + ec.message());

        if (mode == FileLayout::globalOffset) {
            for (auto const& f : files) {
                const auto full = root / f.path;
                if (full.has_parent_path()) {
                    fs::create_directories(full.parent_path(), ec);
                    if (ec) return Result::failure(ErrorCode::StorageFailure, "cannot create " + full.parent_path().string() + ": " + ec.message());
                }
                if (!fs::exists(full, ec)) {
                    std::ofstream touch(full, std::ios::binary);
                    if (!touch) return Result::failure(ErrorCode::StorageFailure, "cannot create " + full.string());
                }
                fs::resize_file(full, f.length, ec);
                if (ec) return Result::failure(ErrorCode::StorageFailure, "cannot size " + full.string() + ": " + ec.message());
            }
        }

        return Result::success(std::unique_ptr<FilePieceStore>(new FilePieceStore(root, files, std::move(layout), mode)));
    }


    fs::path FilePieceStore::piecePath(std::uint32_t piece) const {
        return root_ / (std::to_string(piece) + ".piece");
    }


    template <typename Fn>
    Expected<void> FilePieceStore::forEachSpan(std::uint64_t global, std::uint64_t len, Fn&& fn) const {
        std::uint64_t done = 0;

        // first file whose end lies past the start of the range
        auto it = std::upper_bound(files_.begin(), files_.end(), global,
            [](std::uint64_t pos, const metainfo::FileEntry& f) { return pos < f.offset + f.length; });

        for (; it != files_.end() && done < len; ++it) {
            if (it->length == 0) continue;
            const std::uint64_t pos = global + done;
            const std::uint64_t inFile = pos - it->offset;
            const std::uint64_t n = std::min(len - done, it->length - inFile);

            auto r = fn(*it, inFile, done, n);
            if (!r.has_value()) return r;
            done += n;
        }

        if (done != len) return storageError("range past the end of the last file");
        return Expected<void>::success();
    }


    Expected<void> FilePieceStore::write(std::uint32_t piece, std::uint32_t offset, std::span<const std::uint8_t> bytes) {
        if (!inBounds(layout_, piece, offset, bytes.size())) {
            return storageError("write outside piece " + std::to_string(piece));
        }

        std::scoped_lock lk(mu_);

        auto writeAt = [&](const fs::path& path, std::uint64_t at, const std::uint8_t* data, std::uint64_t n) -> Expected<void> {
            auto* out = handle(path, true);
            if (!out) return storageError("cannot open " + path.string());
            out->seekp(static_cast<std::streamoff>(at));
            out->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
            out->flush();
            if (!*out) {
                handles_.erase(path);
                return storageError("write failed on " + path.string());
            }
            return Expected<void>::success();
        };

        if (mode_ == FileLayout::pieceFiles) {
            std::error_code ec;
            fs::create_directories(root_, ec);
            if (ec) return storageError("cannot create " + root_.string() + ": " + ec.message());
            return writeAt(piecePath(piece), offset, bytes.data(), bytes.size());
        }

        return forEachSpan(layout_.pieceOffset(piece) + offset, bytes.size(),
            [&](const metainfo::FileEntry& f, std::uint64_t inFile, std::uint64_t bufOff, std::uint64_t n) {
                return writeAt(root_ / f.path, inFile, bytes.data() + bufOff, n);
            });
    }


    Expected<Bytes> FilePieceStore::read(std::uint32_t piece) {
        if (piece >= layout_.pieceCount()) {
            return Expected<Bytes>::failure(ErrorCode::StorageFailure, "read of unknown piece " + std::to_string(piece));
        }

        Bytes buf(layout_.pieceSize(piece));

        std::scoped_lock lk(mu_);

        auto readAt = [&](const fs::path& path, std::uint64_t at, std::uint8_t* data, std::uint64_t n) -> Expected<void> {
            auto* in = handle(path, false);
            if (!in) return storageError("cannot open " + path.string());
            in->seekg(static_cast<std::streamoff>(at));
            in->read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(n));
            const bool shortRead = in->gcount() != static_cast<std::streamsize>(n);
            in->clear();
            if (shortRead) return storageError("short read on " + path.string());
            return Expected<void>::success();
        };

        Expected<void> r = (mode_ == FileLayout::pieceFiles)
            ? readAt(piecePath(piece), 0, buf.data(), buf.size())
            : forEachSpan(layout_.pieceOffset(piece), buf.size(),
                [&](const metainfo::FileEntry& f, std::uint64_t inFile, std::uint64_t bufOff, std::uint64_t n) {
                    return readAt(root_ / f.path, inFile, buf.data() + bufOff, n);
                });

        if (!r.has_value()) return Expected<Bytes>::failure(std::move(*r.error));
        return Expected<Bytes>::success(std::move(buf));
    }


    Expected<void> FilePieceStore::finalize() {
        std::scoped_lock lk(mu_);

        std::optional<std::string> closeErr;
        for (auto& [path, f] : handles_) {
            f.close();
            if (!f && !closeErr) closeErr = path.string();
        }
        handles_.clear();
        if (closeErr) return storageError("close failed on " + *closeErr);

        if (mode_ == FileLayout::globalOffset) {
            std::error_code ec;
            for (auto const& f : files_) {
                const auto full = root_ / f.path;
                const auto size = fs::file_size(full, ec);
                if (ec || size != f.length) return storageError("size check failed for " + full.string());
            }
        }
        return Expected<void>::success();
    }


    std::size_t FilePieceStore::openHandles() const {
        std::scoped_lock lk(mu_);
        return handles_.size();
    }


    std::fstream* FilePieceStore::handle(const fs::path& path, bool create) {
        if (auto it = handles_.find(path); it != handles_.end()) {
            it->second.clear();
            return &it->second;
        }
        // past the cap, drop every handle and start over
        if (handles_.size() >= kMaxOpenFiles) handles_.clear();

        const auto rw = std::ios::binary | std::ios::in | std::ios::out;
        std::fstream f(path, rw);
        if (!f && create) {
            std::ofstream touch(path, std::ios::binary);    // pieceFiles: first write creates it
            if (touch) {
                touch.close();
                f.open(path, rw);
            }
        }
        if (!f) return nullptr;
        return &handles_.emplace(path, std::move(f)).first->second;
    }

} // namespace bitleech::piece
