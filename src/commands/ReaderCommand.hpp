#pragma once
#include <memory>

#include "Command.hpp"
#include "scanning/ReversedLinesReader.hpp"

// base for commands that read one file backwards:
// adds filename, --charset, --block-size, --offset and --mmap, opens the reader and reports errors
class ReaderCommand : public Command {
    public:
        int run() override;

    protected:
        ReaderCommand(bool reg, const char* name, const char* description);

        std::unique_ptr<ReversedLinesReader> open_reader();

        // reader is positioned at --offset, if given
        virtual void process(ReversedLinesReader& reader) = 0;
};
