module;
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

module Core:IOBackend.Impl;
import :IOBackend;
import :Error;

namespace Core::IO
{
    namespace
    {
        std::expected<IOReadResult, ErrorCode> Slice(std::span<const std::byte> bytes, const IORequest& request)
        {
            const size_t offset = request.Offset;
            if (offset > bytes.size())
                return std::unexpected(ErrorCode::OutOfRange);

            const size_t readSize = (request.Size == 0) ? (bytes.size() - offset) : request.Size;
            if (offset + readSize > bytes.size())
                return std::unexpected(ErrorCode::OutOfRange);

            IOReadResult result;
            result.Data.assign(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                               bytes.begin() + static_cast<std::ptrdiff_t>(offset + readSize));
            return result;
        }
    }

    std::expected<IOReadResult, ErrorCode> FileIOBackend::Read(const IORequest& request)
    {
        namespace fs = std::filesystem;

        if (request.Path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        std::error_code ec;
        if (!fs::exists(request.Path, ec) || ec)
            return std::unexpected(ErrorCode::FileNotFound);

        std::ifstream file(request.Path, std::ios::binary | std::ios::ate);
        if (!file.is_open())
            return std::unexpected(ErrorCode::FileReadError);

        const auto fileSize = static_cast<size_t>(file.tellg());

        const size_t offset = request.Offset;
        if (offset > fileSize)
            return std::unexpected(ErrorCode::OutOfRange);

        const size_t readSize = (request.Size == 0) ? (fileSize - offset) : request.Size;
        if (offset + readSize > fileSize)
            return std::unexpected(ErrorCode::OutOfRange);

        file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!file)
            return std::unexpected(ErrorCode::FileReadError);

        IOReadResult result;
        result.Data.resize(readSize);
        file.read(reinterpret_cast<char*>(result.Data.data()), static_cast<std::streamsize>(readSize));
        if (!file)
            return std::unexpected(ErrorCode::FileReadError);

        return result;
    }

    std::expected<void, ErrorCode> FileIOBackend::Write(const IORequest& request, std::span<const std::byte> data)
    {
        namespace fs = std::filesystem;

        if (request.Path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        std::error_code ec;
        const auto parent = fs::path(request.Path).parent_path();
        if (!parent.empty())
        {
            fs::create_directories(parent, ec);
            if (ec)
                return std::unexpected(ErrorCode::FileWriteError);
        }

        std::ofstream file(request.Path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return std::unexpected(ErrorCode::FileWriteError);

        if (!data.empty())
        {
            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!file)
                return std::unexpected(ErrorCode::FileWriteError);
        }

        return {};
    }

    void MemoryIOBackend::Put(std::string path, std::vector<std::byte> bytes)
    {
        std::lock_guard lock(m_Mutex);
        m_Files[std::move(path)] = std::move(bytes);
    }

    void MemoryIOBackend::Put(std::string path, std::string_view text)
    {
        const auto* first = reinterpret_cast<const std::byte*>(text.data());
        Put(std::move(path), std::vector<std::byte>(first, first + text.size()));
    }

    std::expected<IOReadResult, ErrorCode> MemoryIOBackend::Read(const IORequest& request)
    {
        if (request.Path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        std::lock_guard lock(m_Mutex);
        auto it = m_Files.find(request.Path);
        if (it == m_Files.end())
            return std::unexpected(ErrorCode::FileNotFound);

        return Slice(it->second, request);
    }

    std::expected<void, ErrorCode> MemoryIOBackend::Write(const IORequest& request, std::span<const std::byte> data)
    {
        if (request.Path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        std::lock_guard lock(m_Mutex);
        m_Files[request.Path].assign(data.begin(), data.end());
        return {};
    }
}
