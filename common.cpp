#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "common.hpp"

using namespace std;

namespace taxi_fare {

void logI(const string&s){ cerr<<"[INFO]  "<<s<<'\n'; }
void logW(const string&s){ cerr<<"[WARN]  "<<s<<'\n'; }
void logE(const string&s){ cerr<<"[ERR]   "<<s<<'\n'; }

void progress(const string&tag,size_t cur,size_t tot,size_t W){
    double f=tot?double(cur)/tot:1.0; size_t filled=size_t(f*W);
    cerr<<"\r"<<tag<<" ["<<string(filled,'=')<<string(W-filled,' ')
        <<"] "<<setw(3)<<int(f*100)<<"% ("<<cur<<'/'<<tot<<')'<<flush;
    if(cur==tot) cerr<<'\n';
}

string trim(const string& s){
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if(b == string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

vector<string> split_fields(const string& line, char sep){
    vector<string> out;
    size_t start = 0;
    for(;;){
        size_t pos = line.find(sep, start);
        if(pos == string::npos){ out.push_back(line.substr(start)); break; }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

static string non_finite_text(double v){
    if(std::isnan(v)) return "NaN";
    return v > 0 ? "Infinity" : "-Infinity";
}

string format_number(double v){
    if(!std::isfinite(v)) return non_finite_text(v);
    if(v == 0.0) return std::signbit(v) ? "-0" : "0";

    char buf[400];
    const double a = std::fabs(v);
    /* fixed notation for the everyday range, %g only for the extremes */
    if(a >= 1e-4 && a < 1e15){
        for(int d = 0; d <= 17; ++d){
            snprintf(buf, sizeof buf, "%.*f", d, v);
            if(strtod(buf, nullptr) == v) return buf;
        }
    }
    for(int p = 1; p <= 17; ++p){
        snprintf(buf, sizeof buf, "%.*g", p, v);
        if(strtod(buf, nullptr) == v) return buf;
    }
    return buf;
}

string format_optional_decimals(double v, int decimals, bool leading_zero){
    if(!std::isfinite(v)) return non_finite_text(v);

    char buf[400];
    snprintf(buf, sizeof buf, "%.*f", decimals, v);
    string s(buf);

    if(s.find('.') != string::npos){
        while(!s.empty() && s.back() == '0') s.pop_back();
        if(!s.empty() && s.back() == '.') s.pop_back();
    }
    if(s == "-0") s = "0";

    if(!leading_zero){
        if(s == "0") return "";
        if(s.compare(0, 2, "0.") == 0)       s.erase(0, 1);
        else if(s.compare(0, 3, "-0.") == 0) s.erase(1, 1);
    }
    return s;
}

} // namespace taxi_fare
