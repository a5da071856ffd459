/**
 * @file io_stream.hh
 * @brief Binary input stream abstraction
 * @ingroup sdk_io
 */

#ifndef BITPLAY_SDK_IO_STREAM_HH
#define BITPLAY_SDK_IO_STREAM_HH

#include <bitplay/sdk/types.hh>
#include <bitplay/export_bitplay.h>
#include <memory>

namespace bitplay {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 * @ingroup sdk_io
 */
enum class seek_origin : int {
    set = 0,  ///< Seek from beginning of stream (SEEK_SET)
    cur = 1,  ///< Seek from current position (SEEK_CUR)
    end = 2   ///< Seek from end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Abstract interface for binary input consumed by decoders
 * @ingroup sdk_io
 *
 * Decoders pull compressed or container bytes through this interface, so
 * the same codec works on files and on memory images (the latter is what
 * the unit tests use).
 *
 * ## Error Handling
 *
 * Methods return error indicators instead of throwing:
 * - read() returns the number of bytes actually read (0 at EOF or error)
 * - seek(), tell() and get_size() return -1 on error
 */
class io_stream {
public:
    virtual ~io_stream() = default;

    /**
     * @brief Read up to size_bytes into ptr
     * @return Bytes actually read
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Move the read position
     * @return New absolute position or -1
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    virtual int64_t tell() = 0;

    virtual int64_t get_size() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Open a file for binary reading
 * @return Stream or nullptr if the file cannot be opened
 */
BITPLAY_EXPORT std::unique_ptr<io_stream> io_from_file(const char* filename);

/**
 * @brief Wrap a read-only memory region (not copied, must outlive the stream)
 */
BITPLAY_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

} // namespace bitplay

#endif // BITPLAY_SDK_IO_STREAM_HH
