#include "BlobCommand.hpp"

class ScanCommand : public BlobCommand {
protected:
    int run() override;

private:
    static ScanCommand instance; // Static instance to trigger registration
    ScanCommand(bool reg=false);

    friend class CmdTestBase<ScanCommand>;
};
