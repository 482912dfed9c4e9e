// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utilmoneystr.h>

#include <cctype>

std::string FormatMoney(const CAmount& n)
{
    CAmount quotient = n / ETHER;
    CAmount remainder = n % ETHER;

    std::string frac = remainder.str();
    frac.insert(0, AMOUNT_DECIMALS - frac.size(), '0');

    // Right-trim excess zeros, keeping at least two decimals
    size_t nTrim = 0;
    for (int i = frac.size() - 1; i >= 2 && frac[i] == '0'; --i)
        ++nTrim;
    frac.erase(frac.size() - nTrim, nTrim);

    return quotient.str() + "." + frac;
}

bool ParseMoney(const std::string& str, CAmount& nRet)
{
    std::string strWhole;
    std::string strFrac;
    bool fSeenDot = false;
    for (char c : str) {
        if (c == '.') {
            if (fSeenDot) return false;
            fSeenDot = true;
            continue;
        }
        if (!isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        if (fSeenDot) {
            strFrac.push_back(c);
        } else {
            strWhole.push_back(c);
        }
    }
    if (strWhole.empty() && strFrac.empty()) return false;
    if (strFrac.size() > static_cast<size_t>(AMOUNT_DECIMALS)) return false;
    // Guard against values that cannot be represented in 256 bits
    if (strWhole.size() > 50) return false;

    strFrac.append(AMOUNT_DECIMALS - strFrac.size(), '0');

    // A leading zero would be parsed as octal
    strWhole.erase(0, strWhole.find_first_not_of('0'));
    strFrac.erase(0, strFrac.find_first_not_of('0'));

    CAmount whole = strWhole.empty() ? CAmount(0) : CAmount(strWhole.c_str());
    CAmount frac = strFrac.empty() ? CAmount(0) : CAmount(strFrac.c_str());
    nRet = whole * ETHER + frac;
    return true;
}
