#include "JsonUtil.h"
#include <sstream>
#include <iomanip>

namespace revkit {
namespace jsonutil {

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for(char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch(c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if(c < 0x20) {
                    static const char* hx = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hx[c >> 4]);
                    out.push_back(hx[c & 0xF]);
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

std::string format_decimal(double value, int precision) {
    std::ostringstream tmp;
    tmp.setf(std::ios::fixed);
    tmp << std::setprecision(precision) << value;
    std::string s = tmp.str();
    if(s.find('.') != std::string::npos) {
        while(s.size() > 1 && s.back() == '0') s.pop_back();
        if(!s.empty() && s.back() == '.') s.push_back('0');
    }
    return s;
}

}
}
