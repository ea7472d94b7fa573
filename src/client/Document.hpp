#ifndef __LP_DOCUMENT__
#define __LP_DOCUMENT__

#include "Headers.hpp"

namespace lp {
/**
 * @brief The page a ClientReconciler applies patches to.
 */
class Document {
 public:
  virtual ~Document() {}

  virtual bool hasElement(const string& id) = 0;
  /** @brief Replaces the element's contents. */
  virtual void setInner(const string& id, const string& html) = 0;
  /** @brief Replaces the element itself. */
  virtual void replaceOuter(const string& id, const string& html) = 0;
  virtual void insertAtEnd(const string& id, const string& html) = 0;
  virtual void insertAtStart(const string& id, const string& html) = 0;
  /** @brief Full page reload. */
  virtual void reload() = 0;
};

/**
 * @brief Flat table of element id -> inner html.
 *
 * Elements do not nest. replaceOuter() takes the replacement's `id`
 * attribute (if any) as the new id and the text between its first '>' and
 * last '<' as its contents.
 */
class MemoryDocument : public Document {
 public:
  MemoryDocument() : reloadCount(0) {}

  void addElement(const string& id, const string& html);
  void removeElement(const string& id);
  /** @brief Contents of the element, or "" if it does not exist. */
  string getContent(const string& id);
  vector<string> getIds();
  int getReloadCount();

  virtual bool hasElement(const string& id);
  virtual void setInner(const string& id, const string& html);
  virtual void replaceOuter(const string& id, const string& html);
  virtual void insertAtEnd(const string& id, const string& html);
  virtual void insertAtStart(const string& id, const string& html);
  virtual void reload();

  /** @brief Value of the first id="..." attribute in `html`, or "". */
  static string extractId(const string& html);

 protected:
  std::recursive_mutex documentMutex;
  map<string, string> elements;
  int reloadCount;
};
}  // namespace lp

#endif  // __LP_DOCUMENT__
