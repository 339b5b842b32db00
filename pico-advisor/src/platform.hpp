#pragma once

#ifdef ARDUINO
  #include <Arduino.h>
  #define PLATFORM_PRINT(x) Serial.println(x)
  inline unsigned long platformMillis(){ return millis(); }
#else
  #include <iostream>
  #include <chrono>
  #include <string>
  #include <cstdio>
  #include <cstdlib>
  class String : public std::string {
  public:
    using std::string::string;
    String() {}
    String(const std::string& s): std::string(s) {}
    String(const char* s): std::string(s) {}
    String(char c): std::string(1, c) {}
    String(int v): std::string(std::to_string(v)) {}
    String(unsigned long v): std::string(std::to_string(v)) {}
    String(double v, unsigned int decimals=2){
      char buf[32]; std::snprintf(buf, sizeof(buf), "%.*f", (int)decimals, v); assign(buf);
    }
    String& operator=(const std::string& s){ std::string::operator=(s); return *this; }
    String& operator=(const char* s){ std::string::operator=(s); return *this; }
    int indexOf(const std::string& sub) const {
      size_t p=find(sub); return p==std::string::npos?-1:(int)p;
    }
    String substring(size_t pos) const { return String(std::string::substr(pos)); }
    String substring(size_t from,size_t to) const { return String(std::string::substr(from,to-from)); }
    void trim(){ size_t s=find_first_not_of(' '); size_t e=find_last_not_of(' '); if(s==std::string::npos){ *this=String(); return;} *this=String(std::string::substr(s,e-s+1)); }
    int toInt() const { return std::atoi(c_str()); }
    bool startsWith(const std::string& sub) const { return rfind(sub,0)==0; }
  };
  #define PLATFORM_PRINT(x) std::cout << (x) << std::endl
  inline unsigned long platformMillis(){
    using namespace std::chrono;
    static const steady_clock::time_point start = steady_clock::now();
    return (unsigned long)duration_cast<milliseconds>(steady_clock::now()-start).count();
  }
#endif

#ifdef DEBUG_MODE
  #define DBG_PRINT(x) PLATFORM_PRINT(x)
#else
  #define DBG_PRINT(x)
#endif
