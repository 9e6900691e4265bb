//
// Copyright Andrew Cox 2017.
// All rights reserved worldwide.
//
#include "test_util.h"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <unistd.h>

namespace blockgrep_test
{
    namespace fs = std::filesystem;

    TempFile::TempFile(const std::string& contents)
    {
        static std::atomic<unsigned> serial{0};
        path_ = (fs::temp_directory_path() /
                 ("blockgrep_test_" + std::to_string(::getpid()) + "_" + std::to_string(serial++) + ".txt")).string();
        std::ofstream out(path_, std::ios_base::binary | std::ios_base::trunc);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        if(!out)
        {
            throw std::runtime_error("cannot write " + path_);
        }
    }

    TempFile::~TempFile()
    {
        std::error_code ignored;
        fs::remove(path_, ignored);
    }

    FailingBuf::FailingBuf(std::string head, std::string tail) :
        head_(std::move(head)),
        tail_(std::move(tail))
    {
        setg(&head_[0], &head_[0], &head_[0] + head_.size());
    }

    FailingBuf::int_type FailingBuf::underflow()
    {
        if(!failed_)
        {
            failed_ = true;
            throw std::runtime_error("device gone");
        }
        if(servedTail_ || tail_.empty())
        {
            return traits_type::eof();
        }
        servedTail_ = true;
        setg(&tail_[0], &tail_[0], &tail_[0] + tail_.size());
        return traits_type::to_int_type(tail_[0]);
    }

    std::string numbered_lines(unsigned count, const std::string& stem)
    {
        std::string text;
        for(unsigned i = 1; i <= count; ++i)
        {
            text += stem + std::to_string(i) + '\n';
        }
        return text;
    }
}
