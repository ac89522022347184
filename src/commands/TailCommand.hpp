#pragma once
#include "ReaderCommand.hpp"

#define TAIL_CMD_NAME "tail"

class TailCommand : public ReaderCommand {
    friend class CmdTestBase<TailCommand>;

protected:
    void process(ReversedLinesReader& reader) override;

private:
    static TailCommand instance; // Static instance to trigger registration
    TailCommand(bool reg=false);
};
