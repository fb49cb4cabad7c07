#pragma once

#include <string>

// SHA-256 of a file's content as lowercase hex. Returns false and fills
// error when the file cannot be read or hashed.
bool calculateChecksum(const std::string& filePath, std::string& digest, std::string& error);
