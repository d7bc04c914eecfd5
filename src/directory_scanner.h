#pragma once

#include <string>
#include <vector>

// Every regular file under root, recursively. Our own temp files are left out.
std::vector<std::string> scan_directory(const std::string &root);
