#include <ctime>
#include <sys/stat.h>
#include "tools/tools.hpp"

using namespace SeqCal;

void SeqCal::createD(const Path &x)
{
    mkdir(x.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
}

bool SeqCal::exists(const FileName &file)
{
    struct stat buffer;
    return (stat(file.c_str(), &buffer) == 0);
}

std::string SeqCal::date()
{
    time_t rawtime;
    struct tm * timeinfo;
    char buffer[80];

    time (&rawtime);
    timeinfo = localtime(&rawtime);

    strftime(buffer, 80, "%d-%m-%Y %H:%M:%S", timeinfo);
    std::string str(buffer);

    return str;
}
