#include "BlobCommand.hpp"

class FindCommand : public BlobCommand {
protected:
    int run() override;

private:
    static FindCommand instance; // Static instance to trigger registration
    FindCommand(bool reg=false);

    friend class CmdTestBase<FindCommand>;
};
