#include "Document.hpp"

namespace lp {
void MemoryDocument::addElement(const string& id, const string& html) {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  elements[id] = html;
}

void MemoryDocument::removeElement(const string& id) {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  elements.erase(id);
}

string MemoryDocument::getContent(const string& id) {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  auto it = elements.find(id);
  if (it == elements.end()) {
    return "";
  }
  return it->second;
}

vector<string> MemoryDocument::getIds() {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  vector<string> ids;
  for (const auto& it : elements) {
    ids.push_back(it.first);
  }
  return ids;
}

int MemoryDocument::getReloadCount() {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  return reloadCount;
}

bool MemoryDocument::hasElement(const string& id) {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  return elements.find(id) != elements.end();
}

void MemoryDocument::setInner(const string& id, const string& html) {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  elements[id] = html;
}

void MemoryDocument::replaceOuter(const string& id, const string& html) {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  elements.erase(id);
  string newId = extractId(html);
  if (newId.empty()) {
    return;
  }
  string content;
  auto open = html.find('>');
  auto close = html.rfind('<');
  if (open != string::npos && close != string::npos && close > open) {
    content = html.substr(open + 1, close - open - 1);
  }
  elements[newId] = content;
}

void MemoryDocument::insertAtEnd(const string& id, const string& html) {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  elements[id] += html;
}

void MemoryDocument::insertAtStart(const string& id, const string& html) {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  elements[id] = html + elements[id];
}

void MemoryDocument::reload() {
  lock_guard<std::recursive_mutex> guard(documentMutex);
  reloadCount++;
}

string MemoryDocument::extractId(const string& html) {
  auto tagEnd = html.find('>');
  string openingTag = html.substr(0, tagEnd);
  size_t pos = 0;
  while ((pos = openingTag.find("id=", pos)) != string::npos) {
    // Skip attributes that merely end in "id", such as data-id
    if (pos > 0 && !isspace((unsigned char)openingTag[pos - 1])) {
      pos += 3;
      continue;
    }
    size_t valueStart = pos + 3;
    if (valueStart >= openingTag.length()) {
      return "";
    }
    char quote = openingTag[valueStart];
    if (quote == '"' || quote == '\'') {
      auto valueEnd = openingTag.find(quote, valueStart + 1);
      if (valueEnd == string::npos) {
        return "";
      }
      return openingTag.substr(valueStart + 1, valueEnd - valueStart - 1);
    }
    auto valueEnd = openingTag.find_first_of(" \t\r\n/", valueStart);
    return openingTag.substr(valueStart, valueEnd == string::npos
                                             ? string::npos
                                             : valueEnd - valueStart);
  }
  return "";
}
}  // namespace lp
