#pragma once

#include <string>
#include <vector>
#include "../helpers/memory/Memory.hpp"

// One exported symbol we shadow, plus the next definition in the lookup chain.
class CSymbolHook {
  public:
    CSymbolHook(std::string symbol, std::string description);
    ~CSymbolHook() = default;

    bool resolve();

    CSymbolHook(const CSymbolHook&)            = delete;
    CSymbolHook(CSymbolHook&&)                 = delete;
    CSymbolHook& operator=(const CSymbolHook&) = delete;
    CSymbolHook& operator=(CSymbolHook&&)      = delete;

    template <typename T>
    T original() const {
        return rc<T>(m_original);
    }

    void*       m_original = nullptr;
    std::string m_symbol, m_description;
    bool        m_active = false;
};

class CHookSystem {
  public:
    CHookSystem();

    CSymbolHook*                           initHook(const std::string& symbol, const std::string& description);
    CSymbolHook*                           getHook(const std::string& symbol) const;

    const std::vector<UP<CSymbolHook>>&    hooks() const;

    // human readable summary of what we intercept, for CONSTELLATION_CURSOR_INFO
    std::string describe() const;

  private:
    std::vector<UP<CSymbolHook>> m_hooks;
};

// created once, the first time any export or the attach constructor needs it
CHookSystem& hookSystem();

namespace NHooks {
    // Set while we forward into the real implementation. libdrm's legacy cursor calls
    // land in our ioctl() again and must go straight through.
    class CForwardGuard {
      public:
        CForwardGuard();
        ~CForwardGuard();

        CForwardGuard(const CForwardGuard&)            = delete;
        CForwardGuard& operator=(const CForwardGuard&) = delete;

      private:
        bool m_previous = false;
    };

    bool inForward();
};
