#include "TerminalOutputFilter.hpp"

namespace dx {
namespace {
const char ESC = '\x1b';
const char BEL = '\x07';

string keepPrintable(const string& data) {
  string out;
  out.reserve(data.length());
  for (char c : data) {
    unsigned char u = (unsigned char)c;
    if (c == '\n' || (u >= 0x20 && u <= 0x7e)) {
      out.push_back(c);
    }
  }
  return out;
}

string collapseBlankLines(const string& data) {
  string out;
  out.reserve(data.length());
  size_t newlines = 0;
  for (char c : data) {
    if (c == '\n') {
      if (++newlines > 2) continue;
    } else {
      newlines = 0;
    }
    out.push_back(c);
  }
  return out;
}

string filterOnce(const string& data) {
  string filtered;
  filtered.reserve(data.length());
  for (char c : data) {
    if (c != '\0') filtered.push_back(c);
  }
  filtered = removeRepeatedRuns(filtered);
  filtered = stripAnsiSequences(filtered);
  filtered = keepPrintable(filtered);
  return collapseBlankLines(filtered);
}
}  // namespace

string removeRepeatedRuns(const string& data, size_t minRun) {
  string out;
  out.reserve(data.length());
  size_t i = 0;
  while (i < data.length()) {
    size_t j = i + 1;
    while (j < data.length() && data[j] == data[i]) {
      j++;
    }
    if (j - i < minRun) {
      out.append(data, i, j - i);
    }
    i = j;
  }
  return out;
}

string stripAnsiSequences(const string& data) {
  string out;
  out.reserve(data.length());
  size_t i = 0;
  while (i < data.length()) {
    if (data[i] != ESC) {
      out.push_back(data[i++]);
      continue;
    }
    if (i + 1 >= data.length()) {
      // Lone trailing ESC
      i++;
      continue;
    }
    char kind = data[i + 1];
    if (kind == '[') {
      // CSI: parameter bytes, intermediate bytes, one final byte
      size_t j = i + 2;
      while (j < data.length() && data[j] >= 0x30 && data[j] <= 0x3f) j++;
      while (j < data.length() && data[j] >= 0x20 && data[j] <= 0x2f) j++;
      if (j < data.length() && data[j] >= 0x40 && data[j] <= 0x7e) j++;
      i = j;
    } else if (kind == ']') {
      // OSC: runs to BEL or ST (ESC \)
      size_t j = i + 2;
      while (j < data.length()) {
        if (data[j] == BEL) {
          j++;
          break;
        }
        if (data[j] == ESC && j + 1 < data.length() && data[j + 1] == '\\') {
          j += 2;
          break;
        }
        j++;
      }
      i = j;
    } else {
      i += 2;
    }
  }
  return out;
}

string filterTerminalOutput(const string& data) {
  string current = data;
  while (true) {
    string next = filterOnce(current);
    if (next == current) {
      return next;
    }
    current = std::move(next);
  }
}
}  // namespace dx
