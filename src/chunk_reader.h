//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#ifndef BLOCKGREP_CHUNK_READER_H
#define BLOCKGREP_CHUNK_READER_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace blockgrep {

    /**
     * A line aligned window of the input. Every chunk but the last ends with a
     * '\n'. The bytes are owned by the ChunkReader and stay valid until its next
     * call to next_chunk() or close().
     */
    struct Chunk
    {
        std::string_view bytes;
        /// Offset of bytes[0] within the whole input.
        std::uint64_t offset = 0;
    };

    /**
     * Pulls a byte stream in bounded reads and hands it out in whole lines.
     *
     * The bytes after the last terminator of a read are held back (the
     * carry-over) and put in front of the next chunk. A line longer than the
     * read size makes the reader keep reading until it sees the terminator or
     * the end of the input, so lines are never cut. At most two buffers are
     * held: the current chunk and the carry-over.
     */
    class ChunkReader
    {
    public:
        /**
         * Read from a stream owned by the caller.
         * @param name Used in error messages only.
         */
        explicit ChunkReader(std::istream& input, std::string name = "<stream>");

        /**
         * Open a file for reading.
         * @throws ReadError if the file cannot be opened.
         */
        static ChunkReader open(const std::string& path);

        ChunkReader(ChunkReader&&) = default;
        ChunkReader& operator=(ChunkReader&&) = default;
        ChunkReader(const ChunkReader&) = delete;
        ChunkReader& operator=(const ChunkReader&) = delete;

        /**
         * Fetch the next chunk.
         *
         * @param chunk Set to the next chunk when true is returned.
         * @param maxSize Number of bytes requested from the stream per read.
         * Must be non-zero.
         * @return false once the input is exhausted or the reader is closed.
         * @throws ReadError on a stream failure, including a stream that was
         * already failed when handed over. Offsets stay as they were after the
         * last chunk handed out, and every byte already taken from the stream
         * (including those of an unfinished long line) is held as carry-over.
         */
        bool next_chunk(Chunk& chunk, std::size_t maxSize);

        /**
         * Drop the file handle (if owned) and both buffers. Safe to call twice.
         */
        void close();

        bool is_open() const { return input_ != nullptr; }
        std::uint64_t bytes_consumed() const { return consumed_; }
        const std::string& name() const { return name_; }

    private:
        ChunkReader(std::unique_ptr<std::ifstream> file, std::string name);

        std::unique_ptr<std::ifstream> owned_;
        std::istream* input_;
        std::string name_;
        std::string buffer_;
        std::string carry_;
        std::uint64_t consumed_ = 0;
        bool eof_ = false;
    };
}

#endif //BLOCKGREP_CHUNK_READER_H
