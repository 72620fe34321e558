#include "Command.hpp"

class EncodeCommand : public Command {
protected:
    int run() override;

private:
    static EncodeCommand instance; // Static instance to trigger registration
    EncodeCommand(bool reg=false);

    friend class CmdTestBase<EncodeCommand>;
};
