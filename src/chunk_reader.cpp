//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#include "chunk_reader.h"
#include "errors.h"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace blockgrep
{
    using std::string;
    using std::string_view;

    ChunkReader::ChunkReader(std::istream& input, string name) :
        input_(&input),
        name_(std::move(name))
    {}

    ChunkReader::ChunkReader(std::unique_ptr<std::ifstream> file, string name) :
        owned_(std::move(file)),
        input_(owned_.get()),
        name_(std::move(name))
    {}

    ChunkReader ChunkReader::open(const string& path)
    {
        auto file = std::make_unique<std::ifstream>(path, std::ios_base::in | std::ios_base::binary);
        if(!file->is_open())
        {
            const int err = errno;
            throw ReadError(path, err ? std::strerror(err) : "cannot open file");
        }
        spdlog::debug("opened {}", path);
        return ChunkReader(std::move(file), path);
    }

    // See chunk_reader.h
    bool ChunkReader::next_chunk(Chunk& chunk, std::size_t maxSize)
    {
        if(maxSize == 0)
        {
            throw std::invalid_argument("chunk size must be greater than zero");
        }
        if(!input_)
        {
            return false;
        }

        buffer_.swap(carry_);
        carry_.clear();
        std::size_t searchFrom = 0;
        while(true)
        {
            if(!eof_)
            {
                const std::size_t before = buffer_.size();
                buffer_.resize(before + maxSize);
                input_->read(&buffer_[before], static_cast<std::streamsize>(maxSize));
                buffer_.resize(before + static_cast<std::size_t>(input_->gcount()));
                // A stream that fails without reaching its end (bad, or already
                // failed when handed over) will never deliver more bytes.
                if(input_->bad() || (input_->fail() && !input_->eof()))
                {
                    // Keep everything taken from the stream so far.
                    carry_.swap(buffer_);
                    throw ReadError(name_, "stream read failed after " +
                                           std::to_string(consumed_ + carry_.size()) + " bytes");
                }
                eof_ = input_->eof();
            }

            const auto lastNewline = string_view(buffer_).substr(searchFrom).rfind('\n');
            if(lastNewline != string_view::npos)
            {
                const std::size_t cut = searchFrom + lastNewline + 1;
                carry_.assign(buffer_, cut, string::npos);
                buffer_.resize(cut);
                break;
            }
            if(eof_)
            {
                // Whatever is left is the final, unterminated line.
                break;
            }
            searchFrom = buffer_.size();
        }

        if(buffer_.empty())
        {
            return false;
        }
        chunk.bytes = buffer_;
        chunk.offset = consumed_;
        consumed_ += buffer_.size();
        return true;
    }

    void ChunkReader::close()
    {
        input_ = nullptr;
        owned_.reset();
        string().swap(buffer_);
        string().swap(carry_);
    }
}
