#pragma once
#include <map>

#include "utils/common.hpp"

#define REGISTER_COMMAND(klass)                 \
    klass klass::instance(true);                \
    extern "C" void force_link_##klass() {}     // Define function to force linker to keep TU

// for declaring friends like "friend class CmdTestBase<TailCommand>"
template<typename T> class CmdTestBase;

class Command {
    public:
        virtual int run() = 0;
        virtual ~Command() {}

        static std::map<std::string, Command*>& registry() {
            static std::map<std::string, Command*> registry;
            return registry;
        }

        // nullptr if there is no such command
        static Command* find(const std::string& name) {
            auto it = registry().find(name);
            return it == registry().end() ? nullptr : it->second;
        }

        const std::string& name() const {
            return m_name;
        }

        argparse::ArgumentParser& parser() {
            return m_parser;
        }

    protected:
        Command(bool reg, const char* name, const char* description) :
            m_name(name), m_parser(name, "", argparse::default_arguments::help)
        {
            m_parser.add_description(description);
            register_common_args(m_parser);
            if( reg ){
                if( find(m_name) ){
                    throw std::runtime_error("Command already registered: " + m_name);
                }
                registry()[m_name] = this;
            }
        }

        const std::string m_name;
        argparse::ArgumentParser m_parser;
};
