#pragma once

#include <string>

struct GeneratedDocument {
    std::string content;
    std::string suggested_filename;
};
