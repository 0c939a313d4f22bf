#ifndef LINEDOCS_COMMON_INFLATER_H
#define LINEDOCS_COMMON_INFLATER_H

#include <linedocs/common/constants.h>
#include <linedocs/common/logging.h>
#include <linedocs/common/platform_compat.h>
#include <zlib.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace linedocs {

// Forward-only zlib inflater pulling compressed input from a FILE *.
class Inflater {
   public:
    static constexpr std::size_t BUFFER_SIZE = constants::inflater::BUFFER_SIZE;
    int bits;
    z_stream stream;
    alignas(64) unsigned char in_buffer[BUFFER_SIZE];

   public:
    Inflater()
        : bits(constants::inflater::ZLIB_GZIP_WINDOW_BITS), initialized_(false) {
        std::memset(&stream, 0, sizeof(stream));
    }

    ~Inflater() { reset(); }

    Inflater(const Inflater &) = delete;
    Inflater &operator=(const Inflater &) = delete;

    bool initialize(FILE *file,
                    int bits_ = constants::inflater::ZLIB_GZIP_WINDOW_BITS) {
        reset();
        bits = bits_;
        if (inflateInit2(&stream, bits) != Z_OK) {
            LINEDOCS_LOG_DEBUG("inflateInit2 failed: {}",
                               stream.msg ? stream.msg : "no message");
            return false;
        }
        initialized_ = true;

        if (fseeko(file, 0, SEEK_SET) != 0) {
            LINEDOCS_LOG_DEBUG("Failed to rewind compressed input: {}",
                               std::strerror(errno));
            return false;
        }

        stream.avail_in = 0;
        stream.next_in = nullptr;
        return true;
    }

    void reset() {
        if (initialized_) {
            inflateEnd(&stream);
            initialized_ = false;
        }
        std::memset(&stream, 0, sizeof(stream));
    }

    // Fills buf with up to len decompressed bytes. bytes_out == 0 with a true
    // return means the compressed input is exhausted. Concatenated gzip
    // members are decoded back to back.
    bool read(FILE *file, unsigned char *buf, std::size_t len,
              std::size_t &bytes_out) {
        stream.next_out = buf;
        stream.avail_out = static_cast<uInt>(len);
        bytes_out = 0;

        while (stream.avail_out > 0) {
            if (stream.avail_in == 0) {
                std::size_t n = ::fread(in_buffer, 1, sizeof(in_buffer), file);
                if (n == 0) {
                    if (std::ferror(file)) {
                        LINEDOCS_LOG_DEBUG(
                            "Error reading from file during inflation with "
                            "error: {}",
                            std::strerror(errno));
                        return false;
                    }
                    break;
                }
                stream.next_in = in_buffer;
                stream.avail_in = static_cast<uInt>(n);
            }
            int ret = inflate(&stream, Z_NO_FLUSH);

            if (ret == Z_STREAM_END) {
                if (stream.avail_in == 0 && std::feof(file)) {
                    break;
                }
                if (inflateReset(&stream) != Z_OK) {
                    return false;
                }
                continue;
            }
            if (ret != Z_OK) {
                LINEDOCS_LOG_DEBUG("inflate() failed with error: {} ({})", ret,
                                   stream.msg ? stream.msg : "no message");
                return false;
            }
        }

        bytes_out = len - stream.avail_out;
        return true;
    }

   private:
    bool initialized_;
};

}  // namespace linedocs

#endif  // LINEDOCS_COMMON_INFLATER_H
