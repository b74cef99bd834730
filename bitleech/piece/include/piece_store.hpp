#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>
#include "types.hpp"
#include "../../common/include/expected.hpp"


namespace bitleech::piece {

    // Where verified bytes end up. Errors are StorageFailure.
    class IPieceStore 
    {
    public:
        virtual ~IPieceStore() = default;

        // Writing the same bytes twice at the same place is harmless.
        virtual Expected<void> write(std::uint32_t piece, std::uint32_t offset, std::span<const std::uint8_t> bytes) = 0;
        virtual Expected<Bytes> read(std::uint32_t piece) = 0;
        virtual Expected<void> finalize() = 0;
    };


    class MemoryPieceStore : public IPieceStore 
    {
    public:
        explicit MemoryPieceStore(PieceLayout layout);

        Expected<void> write(std::uint32_t piece, std::uint32_t offset, std::span<const std::uint8_t> bytes) override;
        Expected<Bytes> read(std::uint32_t piece) override;
        Expected<void> finalize() override;

        const Bytes& contents() const noexcept { return data_; }
        int finalizeCalls() const noexcept { return finalizeCalls_; }
        std::size_t writes() const noexcept { return writes_; }

    private:
        PieceLayout layout_;
        Bytes data_;
        std::size_t writes_{0};
        int finalizeCalls_{0};
    };


    enum class FileLayout 
    {
        globalOffset,   // torrent byte b lands in the file whose [offset, offset+length) holds it
        pieceFiles      // one file per piece, no mapping
    };

    const char* toString(FileLayout l) noexcept;


    // Keeps a read/write handle open per file it touched until finalize().
    class FilePieceStore : public IPieceStore 
    {
    public:
        static constexpr std::size_t kMaxOpenFiles = 64;

        // Rejects absolute paths and empty, "." or ".." segments; creates the
        // directory tree and sizes every file up front.
        static Expected<std::unique_ptr<FilePieceStore>> open(const std::filesystem::path& root,
            const std::vector<metainfo::FileEntry>& files, PieceLayout layout, FileLayout mode);

        Expected<void> write(std::uint32_t piece, std::uint32_t offset, std::span<const std::uint8_t> bytes) override;
        Expected<Bytes> read(std::uint32_t piece) override;
        Expected<void> finalize() override;

        std::filesystem::path piecePath(std::uint32_t piece) const;
        const std::filesystem::path& root() const noexcept { return root_; }
        std::size_t openHandles() const;

    private:
        FilePieceStore(std::filesystem::path root, std::vector<metainfo::FileEntry> files, PieceLayout layout, FileLayout mode);

        // Calls fn(file, fileOffset, bufferOffset, len) for each file overlapping the range.
        template <typename Fn>
        Expected<void> forEachSpan(std::uint64_t global, std::uint64_t len, Fn&& fn) const;

        // nullptr if the file cannot be opened (or is missing and create is false)
        std::fstream* handle(const std::filesystem::path& path, bool create);

        std::filesystem::path root_;
        std::vector<metainfo::FileEntry> files_;
        PieceLayout layout_;
        FileLayout mode_;

        mutable std::mutex mu_;
        std::map<std::filesystem::path, std::fstream> handles_;
    };

    bool isSafeRelativePath(const std::filesystem::path& p);

} // namespace bitleech::piece
