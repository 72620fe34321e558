#include "Command.hpp"

#define TEST_CMD_NAME "test"

class TestCommand : public Command {
protected:
    int run() override;

private:
    static TestCommand instance; // Static instance to trigger registration
    TestCommand(bool reg=false);

    friend class CmdTestBase<TestCommand>;
};
