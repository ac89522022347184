#pragma once
#include "ReaderCommand.hpp"

class TacCommand : public ReaderCommand {
    friend class CmdTestBase<TacCommand>;

protected:
    void process(ReversedLinesReader& reader) override;

private:
    static TacCommand instance; // Static instance to trigger registration
    TacCommand(bool reg=false);
};
