#pragma once

#include <string>
#include <vector>

#include "stash/core/errors.hpp"
#include "stash/storage/buffer.hpp"

namespace stash::storage {

    // Pull-based byte stream feeding the object writer.
    // read() fills up to out.len bytes; *n == 0 marks end of stream.
    class ByteSource {
    public:
        virtual ~ByteSource() = default;
        [[nodiscard]] virtual stash::core::Status read(BufferMut out, u32* n) noexcept = 0;
    };

    class MemorySource final : public ByteSource {
    public:
        explicit MemorySource(BufferView data) noexcept : data_(data) {}

        [[nodiscard]] stash::core::Status read(BufferMut out, u32* n) noexcept override;

    private:
        BufferView data_;
        u32 pos_{0};
    };

    class FileSource final : public ByteSource {
    public:
        FileSource() noexcept = default;
        ~FileSource() override;

        FileSource(const FileSource&) = delete;
        FileSource& operator=(const FileSource&) = delete;

        [[nodiscard]] stash::core::Status open(const std::string& path) noexcept;
        [[nodiscard]] stash::core::Status read(BufferMut out, u32* n) noexcept override;

    private:
        int fd_{-1};
    };

} // namespace stash::storage
