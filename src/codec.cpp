#include "dirpack/codec.hpp"

#include "dirpack/constants.hpp"
#include "dirpack/env.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

namespace dirpack::codec {

namespace {

// One compression or decompression pass. Input arrives in chunks through
// Feed(); produced bytes go straight to `out`.
class Stream {
public:
    virtual ~Stream() = default;

    // `last` marks the final chunk. Returns true once the stream has ended.
    virtual bool Feed(const std::uint8_t* data, std::size_t size, bool last, std::ostream& out) = 0;
};

void Emit(std::ostream& out, const std::vector<std::uint8_t>& buffer, std::size_t size) {
    if (size > 0) {
        out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(size));
    }
}

// gzip framing over zlib deflate/inflate; the reader accepts concatenated members.
class GzipStream : public Stream {
public:
    GzipStream(bool compress, int level) : compress_(compress), buffer_(constants::kIoChunkSize) {
        int rc = compress ? deflateInit2(&strm_, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY)
                          : inflateInit2(&strm_, 15 + 16);
        if (rc != Z_OK) {
            throw std::runtime_error("Failed to initialize gzip stream");
        }
    }

    ~GzipStream() override {
        if (compress_) {
            deflateEnd(&strm_);
        } else {
            inflateEnd(&strm_);
        }
    }

    bool Feed(const std::uint8_t* data, std::size_t size, bool last, std::ostream& out) override {
        if (!compress_ && ended_ && size > 0) {
            inflateReset(&strm_);
            ended_ = false;
        }
        strm_.next_in = const_cast<Bytef*>(data);
        strm_.avail_in = static_cast<uInt>(size);
        return compress_ ? Deflate(last, out) : Inflate(out);
    }

private:
    bool Deflate(bool last, std::ostream& out) {
        int rc = Z_OK;
        do {
            strm_.next_out = buffer_.data();
            strm_.avail_out = static_cast<uInt>(buffer_.size());
            rc = deflate(&strm_, last ? Z_FINISH : Z_NO_FLUSH);
            if (rc == Z_STREAM_ERROR) {
                throw std::runtime_error("gzip compression failed");
            }
            Emit(out, buffer_, buffer_.size() - strm_.avail_out);
        } while (strm_.avail_out == 0);
        return rc == Z_STREAM_END;
    }

    bool Inflate(std::ostream& out) {
        while (true) {
            strm_.next_out = buffer_.data();
            strm_.avail_out = static_cast<uInt>(buffer_.size());
            int rc = inflate(&strm_, Z_NO_FLUSH);
            if (rc == Z_BUF_ERROR) {
                break;
            }
            if (rc != Z_OK && rc != Z_STREAM_END) {
                throw std::runtime_error("Corrupted gzip data");
            }
            Emit(out, buffer_, buffer_.size() - strm_.avail_out);
            if (rc == Z_STREAM_END) {
                if (strm_.avail_in == 0) {
                    ended_ = true;
                    break;
                }
                inflateReset(&strm_);
                continue;
            }
            ended_ = false;
            if (strm_.avail_in == 0 && strm_.avail_out != 0) {
                break;
            }
        }
        return ended_;
    }

    bool compress_;
    bool ended_ = false;
    z_stream strm_{};
    std::vector<std::uint8_t> buffer_;
};

// libbz2 low-level interface; the reader restarts on concatenated streams.
class Bzip2Stream : public Stream {
public:
    Bzip2Stream(bool compress, int block_size)
        : compress_(compress), block_size_(block_size), buffer_(constants::kIoChunkSize) {
        Init();
    }

    ~Bzip2Stream() override { End(); }

    bool Feed(const std::uint8_t* data, std::size_t size, bool last, std::ostream& out) override {
        if (!compress_ && ended_ && size > 0) {
            Restart();
        }
        strm_.next_in = reinterpret_cast<char*>(const_cast<std::uint8_t*>(data));
        strm_.avail_in = static_cast<unsigned int>(size);
        return compress_ ? Compress(last, out) : Decompress(out);
    }

private:
    void Init() {
        strm_ = bz_stream{};
        int rc = compress_ ? BZ2_bzCompressInit(&strm_, block_size_, 0, 0)
                           : BZ2_bzDecompressInit(&strm_, 0, 0);
        if (rc != BZ_OK) {
            throw std::runtime_error("Failed to initialize bzip2 stream");
        }
    }

    void End() {
        if (compress_) {
            BZ2_bzCompressEnd(&strm_);
        } else {
            BZ2_bzDecompressEnd(&strm_);
        }
    }

    // Keeps the unread input across re-initialisation.
    void Restart() {
        char* next_in = strm_.next_in;
        unsigned int avail_in = strm_.avail_in;
        End();
        Init();
        strm_.next_in = next_in;
        strm_.avail_in = avail_in;
        ended_ = false;
    }

    bool Compress(bool last, std::ostream& out) {
        int rc = BZ_OK;
        do {
            strm_.next_out = reinterpret_cast<char*>(buffer_.data());
            strm_.avail_out = static_cast<unsigned int>(buffer_.size());
            rc = BZ2_bzCompress(&strm_, last ? BZ_FINISH : BZ_RUN);
            if (rc < 0) {
                throw std::runtime_error("bzip2 compression failed (error " + std::to_string(rc) + ")");
            }
            Emit(out, buffer_, buffer_.size() - strm_.avail_out);
        } while (last ? rc != BZ_STREAM_END : strm_.avail_in > 0);
        return rc == BZ_STREAM_END;
    }

    bool Decompress(std::ostream& out) {
        while (true) {
            strm_.next_out = reinterpret_cast<char*>(buffer_.data());
            strm_.avail_out = static_cast<unsigned int>(buffer_.size());
            int rc = BZ2_bzDecompress(&strm_);
            if (rc != BZ_OK && rc != BZ_STREAM_END) {
                throw std::runtime_error("Corrupted bzip2 data (error " + std::to_string(rc) + ")");
            }
            Emit(out, buffer_, buffer_.size() - strm_.avail_out);
            if (rc == BZ_STREAM_END) {
                if (strm_.avail_in == 0) {
                    ended_ = true;
                    break;
                }
                Restart();
                continue;
            }
            if (strm_.avail_in == 0 && strm_.avail_out != 0) {
                break;
            }
        }
        return ended_;
    }

    bool compress_;
    int block_size_;
    bool ended_ = false;
    bz_stream strm_{};
    std::vector<std::uint8_t> buffer_;
};

class XzStream : public Stream {
public:
    XzStream(bool compress, std::uint32_t preset) : buffer_(constants::kIoChunkSize) {
        lzma_ret rc = compress ? lzma_easy_encoder(&strm_, preset, LZMA_CHECK_CRC64)
                               : lzma_stream_decoder(&strm_, UINT64_MAX, LZMA_CONCATENATED);
        if (rc != LZMA_OK) {
            throw std::runtime_error("Failed to initialize xz stream");
        }
    }

    ~XzStream() override { lzma_end(&strm_); }

    bool Feed(const std::uint8_t* data, std::size_t size, bool last, std::ostream& out) override {
        strm_.next_in = data;
        strm_.avail_in = size;
        lzma_ret rc = LZMA_OK;
        do {
            strm_.next_out = buffer_.data();
            strm_.avail_out = buffer_.size();
            rc = lzma_code(&strm_, last ? LZMA_FINISH : LZMA_RUN);
            if (rc != LZMA_OK && rc != LZMA_STREAM_END) {
                throw std::runtime_error("xz stream failed (error " + std::to_string(static_cast<int>(rc)) + ")");
            }
            Emit(out, buffer_, buffer_.size() - strm_.avail_out);
        } while (rc != LZMA_STREAM_END && (last || strm_.avail_in > 0 || strm_.avail_out == 0));
        return rc == LZMA_STREAM_END;
    }

private:
    lzma_stream strm_ = LZMA_STREAM_INIT;
    std::vector<std::uint8_t> buffer_;
};

std::unique_ptr<Stream> OpenStream(Compression compression, bool compress, int level) {
    switch (compression) {
        case Compression::Gzip:
            return std::make_unique<GzipStream>(compress, level);
        case Compression::Bzip2:
            return std::make_unique<Bzip2Stream>(compress, level);
        case Compression::Xz:
            return std::make_unique<XzStream>(compress, static_cast<std::uint32_t>(level));
        case Compression::None:
            break;
    }
    throw std::logic_error("No stream for uncompressed data");
}

const char* CompressionName(Compression compression) {
    switch (compression) {
        case Compression::Gzip:
            return "gzip";
        case Compression::Bzip2:
            return "bzip2";
        case Compression::Xz:
            return "xz";
        case Compression::None:
            break;
    }
    return "raw";
}

// Runs the whole of `input` through `stream` into `output`.
void Pump(const std::filesystem::path& input,
          const std::filesystem::path& output,
          Stream& stream,
          const std::string& what) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open " + what + " input: " + input.string());
    }
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open " + what + " output: " + output.string());
    }
    std::vector<std::uint8_t> buffer(constants::kIoChunkSize);
    bool ended = false;
    while (true) {
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (in.bad()) {
            throw std::runtime_error("Failed to read " + what + " input: " + input.string());
        }
        bool last = in.eof();
        ended = stream.Feed(buffer.data(), static_cast<std::size_t>(in.gcount()), last, out);
        if (last) {
            break;
        }
    }
    if (!ended) {
        throw std::runtime_error("Truncated " + what + " data in " + input.string());
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write " + what + " output: " + output.string());
    }
}

}  // namespace

int DefaultLevel(Compression compression) {
    if (compression == Compression::Xz) {
        return env::GetInt(constants::kEnvCompressionLevel, 0, 9)
            .value_or(static_cast<int>(constants::kXzPreset));
    }
    int fallback = compression == Compression::Bzip2 ? constants::kBzip2BlockSize : constants::kGzipLevel;
    return env::GetInt(constants::kEnvCompressionLevel, 1, 9).value_or(fallback);
}

void CompressFile(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  Compression compression,
                  std::optional<int> level) {
    if (compression == Compression::None) {
        std::filesystem::copy_file(input, output, std::filesystem::copy_options::overwrite_existing);
        return;
    }
    auto stream = OpenStream(compression, true, level.value_or(DefaultLevel(compression)));
    Pump(input, output, *stream, CompressionName(compression));
}

void DecompressFile(const std::filesystem::path& input,
                    const std::filesystem::path& output,
                    Compression compression) {
    if (compression == Compression::None) {
        std::filesystem::copy_file(input, output, std::filesystem::copy_options::overwrite_existing);
        return;
    }
    auto stream = OpenStream(compression, false, 0);
    Pump(input, output, *stream, CompressionName(compression));
}

}  // namespace dirpack::codec
