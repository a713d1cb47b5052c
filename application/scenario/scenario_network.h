/** @file
*****************************************************************************

Networking for Demo Scenarios / Simulation

Provides classes for parties in a network, with routines for communication.
Communication is point to point, network participants are identified and
addressed by their name. Communication is either done directly in RAM using
a std::map, or via file-system. The latter option allows to demonstrate
correct serialization and deserialization.

Byte strings (key blobs, instructions) are written to files verbatim, every
other type goes through its stream operators.
*****************************************************************************/

#ifndef SCENARIO_NETWORK_H
#define SCENARIO_NETWORK_H

#include <string>
#include <iostream>
#include <iterator>
#include <fstream>
#include <map>
#include <vector>
#include <stdexcept>
#include <boost/any.hpp>

#include "hostsnark-codec/byte_utils.hpp"

template<typename T>
void write_content(std::ostream &out, const T &content){
    out << content;
}

inline void write_content(std::ostream &out, const byte_vector &content){
    out.write(reinterpret_cast<const char*>(content.data()), content.size());
}

template<typename T>
void read_content(std::istream &in, T &content){
    in >> content;
}

inline void read_content(std::istream &in, byte_vector &content){
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

class Communicator {
private:
    std::map<std::string, boost::any> map;
    uint16_t time;

    std::string handle(const std::string &topic, const std::string &from, const std::string &to) const {
        return topic + "_" + from + "_" + to + "_T" + std::to_string(time);
    }

public:
    enum CommunicationMode {File, Ram};

    CommunicationMode mode;

    Communicator(CommunicationMode mode=File)
    :  time(0), mode(mode) {}

    uint16_t get_time(){
        return time;
    }

    void tick(){
        time++;
    }

    template<typename T>
    void send_to(const T &content, const std::string &topic, const std::string &from, const std::string &to){
        const std::string h = handle(topic, from, to);
        if (mode == File){
            std::ofstream output_file(h, std::ios::out | std::ios::binary);
            if (!output_file){
                throw std::runtime_error("cannot write message " + h);
            }
            write_content(output_file, content);
        }else if(mode == Ram){
            map[h] = content;
        }else {
            throw std::runtime_error("Not implemented");
        }
    }

    template<typename T>
    T receive_from(const std::string &topic, const std::string &from, const std::string &to){
        T content;
        const std::string h = handle(topic, from, to);
        if (mode == File){
            std::ifstream input_file(h, std::ios::in | std::ios::binary);
            if (!input_file){
                throw std::runtime_error("no message " + h);
            }
            input_file >> std::noskipws;
            read_content(input_file, content);
        } else if(mode == Ram){
            const auto it = map.find(h);
            if (it == map.end()){
                throw std::runtime_error("no message " + h);
            }
            content = boost::any_cast<T>(it->second);
        } else{
            throw std::runtime_error("Not implemented");
        }
        return content;
    }

};

class NetworkParticipant {
private:
    Communicator &comm;
protected:
    uint16_t get_time(){
        return comm.get_time();
    }

    template<typename T>
    void send_to(const T &content, const std::string &topic, const std::string &to) {
        comm.send_to<T>(content, topic, name, to);
    }

    template<typename T>
    T receive_from(const std::string &topic, const std::string &from) {
        return comm.receive_from<T>(topic, from, name);
    }

public:
    std::string name;
    NetworkParticipant(std::string name, Communicator &comm) : comm(comm), name(name)  {}
};



#endif //SCENARIO_NETWORK_H
