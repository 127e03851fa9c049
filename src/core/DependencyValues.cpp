#include "core/DependencyValues.hpp"

#include <cstdlib>
#include <stdexcept>

#include <boost/core/demangle.hpp>

#include "common/Log.hpp"

namespace tinydep::core {

namespace detail {

void typeMismatch(const std::string& keyName, const std::type_info& expected, const std::type_info& actual) {
    LOG_ERR("Tipo incompatible para " << keyName << ": se esperaba " << boost::core::demangle(expected.name())
                                      << " y el almacén contiene " << boost::core::demangle(actual.name()));
    std::abort();
}

}  // namespace detail

DependencyValues::DependencyValues(StoragePtr storage) : storage_(std::move(storage)) {
    if (!storage_) {
        throw std::invalid_argument("DependencyValues requiere un almacén");
    }
}

DependencyValues DependencyValues::current() { return DependencyValues(ScopeStack::active()); }

DependencyValues DependencyValues::root() { return DependencyValues(ScopeStack::root()); }

void DependencyValues::resetRoot() {
    ScopeStack::root()->clear();
    LOG_DEBUG("Almacén raíz vaciado");
}

std::size_t DependencyValues::size() const { return storage_->size(); }

std::vector<std::string> DependencyValues::boundKeys() const { return storage_->keyNames(); }

DependencyValues DependencyValues::copy() const { return DependencyValues(storage_->copy()); }

}  // namespace tinydep::core
