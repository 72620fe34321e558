#include "Command.hpp"

class DecodeCommand : public Command {
protected:
    int run() override;

private:
    static DecodeCommand instance; // Static instance to trigger registration
    DecodeCommand(bool reg=false);

    friend class CmdTestBase<DecodeCommand>;
};
