#ifndef UTILS_COMPRESSION_HPP
#define UTILS_COMPRESSION_HPP

#include <zlib.h>
#include <cstdio>
#include <iostream>
#include <streambuf>
#include <string>
#include <vector>

// This namespace contains the zlib backed streams used to store libraries and
// comparison reports on disk.
namespace Compression {

enum state { OK, ERROR };

// Output streambuf that deflates everything written to it into a zlib file.
// Bytes are staged in `buffer' and compressed whenever it fills up.
class DeflateStreambuf : public std::streambuf {
    // Uncompressed data waiting to be deflated.
    std::vector<char> buffer;
    // Scratch space for the deflated output.
    std::vector<unsigned char> out_buffer;

    FILE *out_file = nullptr;

    z_stream strm = {};
    bool strm_ready = false;

   public:
    explicit DeflateStreambuf(size_t buffer_size = 16384);
    // Destructor flushes the buffer, finishes the zlib stream and closes the
    // file.
    ~DeflateStreambuf() override;

    DeflateStreambuf(const DeflateStreambuf &) = delete;
    DeflateStreambuf &operator=(const DeflateStreambuf &) = delete;

    // Returns ERROR if the file can't be created or zlib fails to initialize.
    int open(std::string const &filename);

    // Flush pending data, write the zlib trailer and close the file.
    int close();

   protected:
    int overflow(int c) override;  // Writes byte when buffer is full.
    int sync() override;           // Flushes the buffer.

   private:
    int write_buffer(int flush);  // Compress data from buffer to file.
};

// std::ostream writing a zlib compressed file, used to store libraries and
// reports.
class DeflateStream : private DeflateStreambuf, public std::ostream {
   public:
    explicit DeflateStream(size_t buffer_size = 16384)
        : DeflateStreambuf(buffer_size), std::ostream(this) {}
    explicit DeflateStream(std::string const &filename,
                           size_t buffer_size = 16384)
        : DeflateStreambuf(buffer_size), std::ostream(this) {
        open(filename);
    }

    // Sets the badbit if the file can't be opened.
    void open(std::string const &filename);

    // Finish the compressed file. Sets the badbit if the trailer could not be
    // written.
    void close();
};

// Input streambuf that inflates a zlib file on demand, one buffer at a time.
class InflateStreambuf : public std::streambuf {
    // Decompressed data.
    std::vector<char> buffer;
    // Compressed data read from the file.
    std::vector<unsigned char> in_buffer;

    FILE *in_file = nullptr;

    z_stream strm = {};
    bool strm_ready = false;
    // The zlib trailer has been reached, no more data will be produced.
    bool stream_end = false;

   public:
    explicit InflateStreambuf(size_t buffer_size = 16384);
    ~InflateStreambuf() override;

    InflateStreambuf(const InflateStreambuf &) = delete;
    InflateStreambuf &operator=(const InflateStreambuf &) = delete;

    // Returns ERROR if the file can't be read or zlib fails to initialize.
    int open(std::string const &filename);

   protected:
    int underflow() override;  // Read bytes when buffer is empty.

   private:
    // Decompress data from file into the buffer. Returns the number of bytes
    // available or a negative value on error.
    long read_buffer();
};

// std::istream reading back a file written with DeflateStream.
class InflateStream : private InflateStreambuf, public std::istream {
   public:
    explicit InflateStream(size_t buffer_size = 16384)
        : InflateStreambuf(buffer_size), std::istream(this) {}
    explicit InflateStream(std::string const &filename,
                           size_t buffer_size = 16384)
        : InflateStreambuf(buffer_size), std::istream(this) {
        open(filename);
    }

    // Sets the badbit if the file can't be opened.
    void open(std::string const &filename);
};

}  // namespace Compression

#endif /* UTILS_COMPRESSION_HPP */
