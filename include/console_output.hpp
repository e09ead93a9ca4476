#ifndef CONSOLE_OUTPUT_HPP
#define CONSOLE_OUTPUT_HPP

#include <mutex>
#include <ostream>
#include <string>

// The loop and every consumer run on their own threads but share the
// terminal. All console writes go through these so lines never interleave.
std::mutex& consoleMutex();

// Writes "\n<line>" and ends the line.
void writeConsoleLine(std::ostream& out, const std::string& line);

// Writes "<status>\r" and flushes, so the next status overwrites it.
void writeStatusLine(std::ostream& out, const std::string& status);

#endif // CONSOLE_OUTPUT_HPP
