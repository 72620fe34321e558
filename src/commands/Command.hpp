#pragma once
#include "utils/common.hpp"

#include <map>
#include <stdexcept>
#include <string>

#define REGISTER_COMMAND(klass)                 \
    klass klass::instance(true);                \
    extern "C" void force_link_##klass() {}     // Define function to force linker to keep TU

// for declaring friends like "friend class CmdTestBase<ScanCommand>"
template<typename T> class CmdTestBase;

class Command {
    public:
        virtual ~Command() {}

        // run() with errors logged and turned into exit code 1
        int execute();

        static std::map<std::string, Command*>& registry() {
            static std::map<std::string, Command*> registry;
            return registry;
        }

        argparse::ArgumentParser& parser() {
            return m_parser;
        }

        const std::string& name() const { return m_name; }

    protected:
        Command(bool reg, const char* name, const char* description);

        virtual int run() = 0;

        argparse::ArgumentParser m_parser;
        const std::string m_name;
};
