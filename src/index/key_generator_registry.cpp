#include "index/key_generator_registry.h"
#include "storage/schema_errors.h"
#include "utils/logger.h"

#include <mutex>
#include <stdexcept>

namespace strata {

KeyGeneratorRegistry& KeyGeneratorRegistry::instance() {
    static KeyGeneratorRegistry instance;
    return instance;
}

KeyGeneratorDescriptorPtr KeyGeneratorRegistry::registerKeyGenerator(const std::string& scope, const std::string& name,
                                                                     KeyGeneratorFn fn) {
    if (fn == nullptr) {
        throw std::invalid_argument("Key generator '" + scope + "::" + name + "' cannot be null");
    }
    KeyGeneratorDescriptor d;
    d.scope = scope;
    d.name = name;
    d.generator = fn;
    d.is_static = true;
    d.is_index_key_generator = true;
    return registerDescriptor(std::move(d));
}

KeyGeneratorDescriptorPtr KeyGeneratorRegistry::registerDescriptor(KeyGeneratorDescriptor descriptor) {
    if (descriptor.scope.empty() || descriptor.name.empty()) {
        throw std::invalid_argument("Key generator scope and name must be non-empty");
    }
    if (!descriptor.generator) {
        throw std::invalid_argument("Key generator '" + descriptor.qualifiedName() + "' cannot be null");
    }

    auto ptr = std::make_shared<const KeyGeneratorDescriptor>(std::move(descriptor));
    {
        std::unique_lock lock(mutex_);
        auto& names = scopes_[ptr->scope];
        if (!names.emplace(ptr->name, ptr).second) {
            throw std::invalid_argument("Key generator '" + ptr->qualifiedName() + "' is already registered");
        }
    }
    STRATA_DEBUG("Registered key generator {} (static={}, marked={})",
                 ptr->qualifiedName(), ptr->is_static, ptr->is_index_key_generator);
    return ptr;
}

KeyGeneratorDescriptorPtr KeyGeneratorRegistry::find(const std::string& scope, const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto s = scopes_.find(scope);
    if (s == scopes_.end()) {
        return nullptr;
    }
    auto n = s->second.find(name);
    return n == s->second.end() ? nullptr : n->second;
}

KeyGeneratorDescriptorPtr KeyGeneratorRegistry::resolve(const std::string& scope, const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto s = scopes_.find(scope);
    if (s == scopes_.end()) {
        throw KeyGeneratorResolutionException(scope, name, "declaring scope is not registered");
    }
    auto n = s->second.find(name);
    if (n == s->second.end()) {
        throw KeyGeneratorResolutionException(scope, name, "no generator with this name in scope");
    }
    return n->second;
}

bool KeyGeneratorRegistry::contains(const std::string& scope, const std::string& name) const {
    return find(scope, name) != nullptr;
}

bool KeyGeneratorRegistry::unregister(const std::string& scope, const std::string& name) {
    std::unique_lock lock(mutex_);
    auto s = scopes_.find(scope);
    if (s == scopes_.end()) {
        return false;
    }
    const bool erased = s->second.erase(name) > 0;
    if (s->second.empty()) {
        scopes_.erase(s);
    }
    return erased;
}

std::vector<std::string> KeyGeneratorRegistry::scopes() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(scopes_.size());
    for (const auto& [scope, _] : scopes_) {
        out.push_back(scope);
    }
    return out;
}

std::vector<std::string> KeyGeneratorRegistry::names(const std::string& scope) const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    auto s = scopes_.find(scope);
    if (s != scopes_.end()) {
        for (const auto& [name, _] : s->second) {
            out.push_back(name);
        }
    }
    return out;
}

size_t KeyGeneratorRegistry::size() const {
    std::shared_lock lock(mutex_);
    size_t n = 0;
    for (const auto& [_, names] : scopes_) {
        n += names.size();
    }
    return n;
}

void KeyGeneratorRegistry::clear() {
    std::unique_lock lock(mutex_);
    scopes_.clear();
}

} // namespace strata
