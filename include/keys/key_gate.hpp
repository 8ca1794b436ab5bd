#ifndef VAULT_KEYS_KEY_GATE_HPP
#define VAULT_KEYS_KEY_GATE_HPP

#include <string>

namespace vault::keys {

// Answers whether an opaque client key is known and active.
// The storage engine never looks inside the key.
class KeyGate {
public:
  virtual ~KeyGate() = default;

  virtual bool is_authorized(const std::string& key) const = 0;
};

} // namespace vault::keys

#endif // VAULT_KEYS_KEY_GATE_HPP
