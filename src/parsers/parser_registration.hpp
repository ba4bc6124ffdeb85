// parser_registration.hpp
#pragma once
#include "parser_registry.hpp"

// Static-init order across translation units is unspecified, so the order
// comes from PRIORITY (then name) when the registry is frozen.
#define REGISTER_PARSER(CLASSNAME, PRIORITY) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                ParserRegistry::instance().registerParser(PRIORITY, []() { \
                    return std::make_unique<CLASSNAME>(); \
                }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
