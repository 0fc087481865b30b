module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

export module Core:IOBackend;

import :Error;

export namespace Core::IO
{
    struct IORequest
    {
        std::string Path;
        size_t Offset = 0; // 0 = start of file
        size_t Size = 0;   // 0 = whole file
    };

    struct IOReadResult
    {
        std::vector<std::byte> Data;
    };

    // Byte source for asset imports. Reads happen on worker threads.
    class IIOBackend
    {
    public:
        virtual ~IIOBackend() = default;
        IIOBackend(const IIOBackend&) = delete;
        IIOBackend& operator=(const IIOBackend&) = delete;
        IIOBackend(IIOBackend&&) = delete;
        IIOBackend& operator=(IIOBackend&&) = delete;

        // Synchronous, safe to call from any thread.
        [[nodiscard]] virtual std::expected<IOReadResult, ErrorCode> Read(const IORequest& request) = 0;

        // Full replacement of the destination; Offset/Size are ignored.
        [[nodiscard]] virtual std::expected<void, ErrorCode> Write(const IORequest& request,
                                                                   std::span<const std::byte> data) = 0;

    protected:
        IIOBackend() = default;
    };

    // Loose files via std::ifstream/std::ofstream.
    class FileIOBackend final : public IIOBackend
    {
    public:
        FileIOBackend() = default;

        [[nodiscard]] std::expected<IOReadResult, ErrorCode> Read(const IORequest& request) override;
        [[nodiscard]] std::expected<void, ErrorCode> Write(const IORequest& request,
                                                           std::span<const std::byte> data) override;
    };

    // Path -> bytes map. Used by tools and tests that must not touch disk.
    class MemoryIOBackend final : public IIOBackend
    {
    public:
        MemoryIOBackend() = default;

        void Put(std::string path, std::vector<std::byte> bytes);
        void Put(std::string path, std::string_view text);

        [[nodiscard]] std::expected<IOReadResult, ErrorCode> Read(const IORequest& request) override;
        [[nodiscard]] std::expected<void, ErrorCode> Write(const IORequest& request,
                                                           std::span<const std::byte> data) override;

    private:
        std::mutex m_Mutex;
        std::unordered_map<std::string, std::vector<std::byte>> m_Files;
    };
}
