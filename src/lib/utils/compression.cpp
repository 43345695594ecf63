#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <vector>

#include "utils/compression.hpp"

Compression::DeflateStreambuf::DeflateStreambuf(size_t buffer_size)
    : buffer(buffer_size), out_buffer(buffer_size) {
    // The whole staging buffer is available as the put area.
    setp(buffer.data(), buffer.data() + buffer.size());
}

Compression::DeflateStreambuf::~DeflateStreambuf() { close(); }

int Compression::DeflateStreambuf::open(std::string const &filename) {
    if (out_file != nullptr) {
        return ERROR;
    }
    out_file = std::fopen(filename.c_str(), "wb");
    if (out_file == nullptr) {
        return ERROR;
    }

    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    if (deflateInit(&strm, Z_DEFAULT_COMPRESSION) != Z_OK) {
        std::fclose(out_file);
        out_file = nullptr;
        return ERROR;
    }
    strm_ready = true;
    return OK;
}

int Compression::DeflateStreambuf::close() {
    if (out_file == nullptr) {
        return OK;
    }
    int ret = OK;
    if (sync() == -1) {
        ret = ERROR;
    }
    // Last write with Z_FINISH so zlib flushes its internal state and writes
    // the stream trailer.
    if (write_buffer(Z_FINISH) != Z_STREAM_END) {
        ret = ERROR;
    }
    if (strm_ready) {
        (void)deflateEnd(&strm);
        strm_ready = false;
    }
    if (std::fclose(out_file) != 0) {
        ret = ERROR;
    }
    out_file = nullptr;
    return ret;
}

// Called when the staging buffer is full.
int Compression::DeflateStreambuf::overflow(int c) {
    if (sync() == -1) {
        return EOF;
    }
    if (c == EOF) {
        return 0;
    }
    return sputc(static_cast<char>(c));
}

int Compression::DeflateStreambuf::sync() {
    if (pptr() > pbase()) {
        int ret = write_buffer(Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }
        setp(buffer.data(), buffer.data() + buffer.size());
    }
    return 0;
}

// Deflate the pending bytes of the buffer into the output file. Zlib may keep
// part of the compressed data in its internal state until it is called with
// Z_FINISH.
int Compression::DeflateStreambuf::write_buffer(int flush) {
    if (out_file == nullptr || !strm_ready) {
        return Z_STREAM_ERROR;
    }
    strm.avail_in = static_cast<uInt>(pptr() - pbase());
    strm.next_in = reinterpret_cast<unsigned char *>(pbase());

    int ret = Z_OK;
    do {
        strm.avail_out = static_cast<uInt>(out_buffer.size());
        strm.next_out = out_buffer.data();

        ret = deflate(&strm, flush);
        if (ret == Z_STREAM_ERROR) {
            return ret;
        }

        size_t have = out_buffer.size() - strm.avail_out;
        if (std::fwrite(out_buffer.data(), 1, have, out_file) != have ||
            std::ferror(out_file)) {
            return Z_ERRNO;
        }
    } while (strm.avail_out == 0);

    // Everything in the buffer has been consumed.
    setp(buffer.data(), buffer.data() + buffer.size());
    return ret;
}

void Compression::DeflateStream::open(std::string const &filename) {
    if (DeflateStreambuf::open(filename) == ERROR) {
        setstate(std::ios::badbit);
    }
}

void Compression::DeflateStream::close() {
    flush();
    if (DeflateStreambuf::close() == ERROR) {
        setstate(std::ios::badbit);
    }
}

Compression::InflateStreambuf::InflateStreambuf(size_t buffer_size)
    : buffer(buffer_size), in_buffer(buffer_size) {
    // Empty get area, the first read triggers underflow.
    setg(buffer.data(), buffer.data() + buffer.size(),
         buffer.data() + buffer.size());
}

Compression::InflateStreambuf::~InflateStreambuf() {
    if (strm_ready) {
        (void)inflateEnd(&strm);
    }
    if (in_file != nullptr) {
        std::fclose(in_file);
    }
}

int Compression::InflateStreambuf::open(std::string const &filename) {
    if (in_file != nullptr) {
        return ERROR;
    }
    in_file = std::fopen(filename.c_str(), "rb");
    if (in_file == nullptr) {
        return ERROR;
    }

    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = 0;
    strm.next_in = Z_NULL;
    if (inflateInit(&strm) != Z_OK) {
        std::fclose(in_file);
        in_file = nullptr;
        return ERROR;
    }
    strm_ready = true;
    return OK;
}

int Compression::InflateStreambuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    long nread = read_buffer();
    if (nread <= 0) {
        return EOF;
    }
    setg(buffer.data(), buffer.data(), buffer.data() + nread);
    return traits_type::to_int_type(*gptr());
}

long Compression::InflateStreambuf::read_buffer() {
    if (in_file == nullptr || !strm_ready || stream_end) {
        return 0;
    }

    strm.avail_out = static_cast<uInt>(buffer.size());
    strm.next_out = reinterpret_cast<unsigned char *>(buffer.data());

    // Keep feeding compressed data until some output is produced or the
    // deflate stream ends.
    while (strm.avail_out == buffer.size()) {
        if (strm.avail_in == 0) {
            size_t nread =
                std::fread(in_buffer.data(), 1, in_buffer.size(), in_file);
            if (std::ferror(in_file)) {
                return -1;
            }
            if (nread == 0) {
                // Truncated file.
                return -1;
            }
            strm.avail_in = static_cast<uInt>(nread);
            strm.next_in = in_buffer.data();
        }

        int ret = inflate(&strm, Z_NO_FLUSH);
        switch (ret) {
            case Z_STREAM_END:
                stream_end = true;
                return static_cast<long>(buffer.size() - strm.avail_out);
            case Z_NEED_DICT:
            case Z_DATA_ERROR:
            case Z_MEM_ERROR:
            case Z_STREAM_ERROR:
                return -1;
            default:
                break;
        }
    }
    return static_cast<long>(buffer.size() - strm.avail_out);
}

void Compression::InflateStream::open(std::string const &filename) {
    if (InflateStreambuf::open(filename) == ERROR) {
        setstate(std::ios::badbit);
    }
}
