/** @file
 *****************************************************************************

 Demo application for hostsnark consisting of

 Generator: Setup of the threshold circuit, sends the proving key to the
 prover and the verifying key to the prover and the host. Generator is
 assumed to be honest.

 Prover: Proves that a secret value is at least a public threshold, packages
 the proof for the host and submits it as an instruction.

 Host: Deterministic execution host running the on-host verifier. Every
 instruction ends in one committed verification record or an abort.

 *****************************************************************************/

#include <algorithm>
#include <string>
#include <boost/program_options.hpp>

#include "libff/common/profiling.hpp"

#include "scenario_network.h"
#include "application/gadgets/threshold_gadget.hpp"
#include "hostsnark-verifier/execution_host.hpp"

typedef libff::Fr<hostsnark_pp> FieldT;

class Generator : NetworkParticipant {
private:
    const bool disclose_value;
    const std::string key_dir;

public:
    Generator(bool disclose_value, const std::string &key_dir, std::string name, Communicator &comm) :
        NetworkParticipant(name, comm), disclose_value(disclose_value), key_dir(key_dir) {}
    void setup();
};

void Generator::setup(){
    threshold_circuit<FieldT> circuit(disclose_value);
    const hostsnark_keypair<hostsnark_pp> keypair = hostsnark_generator<hostsnark_pp>(circuit.get_constraint_system());

    if (!key_dir.empty()){
        store_proving_key(key_dir + "/pk.bin", keypair.pk);
        store_verification_key(key_dir + "/vk.bin", keypair.vk);
        return;
    }

    this->send_to(keypair.pk, "pk", "Prover");
    this->send_to(encode_verification_key(keypair.vk), "vk", "Prover");
    this->send_to(encode_verification_key(keypair.vk), "vk", "Host");
}

class Prover : NetworkParticipant {
private:
    hostsnark_proving_key<hostsnark_pp> pk;
    hostsnark_verification_key<hostsnark_pp> vk;
    std::shared_ptr<threshold_circuit<FieldT>> circuit;
    const bool disclose_value;
    const std::string key_dir;

public:
    packaging_mode mode;
    unsigned long value;
    unsigned long threshold;
    boost::optional<uint64_t> required_balance;

    Prover(bool disclose_value, const std::string &key_dir, std::string name, Communicator &comm) :
        NetworkParticipant(name, comm), disclose_value(disclose_value), key_dir(key_dir),
        mode(packaging_mode::prepared), value(0), threshold(0) {}
    void setup(); // Receive keys
    bool run();
};

void Prover::setup(){
    if (!key_dir.empty()){
        pk = load_proving_key(key_dir + "/pk.bin");
        vk = load_verification_key(key_dir + "/vk.bin");
    } else {
        pk = this->receive_from<hostsnark_proving_key<hostsnark_pp>>("pk", "Generator");
        vk = decode_verification_key(this->receive_from<byte_vector>("vk", "Generator"));
    }
    circuit.reset(new threshold_circuit<FieldT>(disclose_value, "threshold"));
}

bool Prover::run(){
    circuit->generate_r1cs_witness(value, threshold);

    hostsnark_proof_output<hostsnark_pp> output;
    try {
        output = hostsnark_prover<hostsnark_pp>(pk, circuit->primary_input(), circuit->auxiliary_input());
    } catch (const constraint_unsatisfied_error &e) {
        std::cerr << "Prover: value " << value << " does not reach threshold " << threshold << ": " << e.what() << std::endl;
        return false;
    }

    const packaged_proof packaged = package_proof(encode_raw_proof(output.proof),
                                                  encode_public_inputs(output.public_inputs),
                                                  vk, mode);
    const hostsnark_error_code self_check = verify_packaged_proof(vk, packaged);
    if (self_check != hostsnark_error_code::none){
        std::cerr << "Prover: packaged proof does not verify locally: " << error_code_name(self_check) << std::endl;
        return false;
    }

    const uint64_t record_index = get_time();
    hostsnark_instruction instruction;
    if (required_balance){
        instruction = verify_proof_with_balance_instruction(record_index, packaged, *required_balance, make_account_id(name));
    } else {
        instruction = verify_proof_instruction(record_index, packaged);
    }

    this->send_to(encode_instruction(instruction), "instruction", "Host");
    return true;
}

class Host : NetworkParticipant {
private:
    std::shared_ptr<execution_host> host;
    const verifier_config config;
    const std::string key_dir;

public:
    int accepted_count;
    int rejected_count;
    int aborted_count;
    uint64_t prover_balance;

    Host(const verifier_config &config, const std::string &key_dir, std::string name, Communicator &comm) :
        NetworkParticipant(name, comm), config(config), key_dir(key_dir),
        accepted_count(0), rejected_count(0), aborted_count(0), prover_balance(0) {}
    void setup();
    void run();
};

void Host::setup(){
    hostsnark_verification_key<hostsnark_pp> vk;
    if (!key_dir.empty()){
        vk = load_verification_key(key_dir + "/vk.bin");
    } else {
        vk = decode_verification_key(this->receive_from<byte_vector>("vk", "Generator"));
    }
    host.reset(new execution_host(onchain_verifier(vk), config));
    host->set_balance(make_account_id("Prover"), prover_balance);
}

void Host::run(){
    const byte_vector instruction = this->receive_from<byte_vector>("instruction", "Prover");
    host->advance_clock(1);

    const execution_result result = host->execute(make_account_id("Prover"), instruction);
    if (!result.committed()){
        aborted_count++;
        std::cout << " Aborted: " << result.abort_reason << std::endl;
        return;
    }

    const verification_record &record = *result.record;
    if (record.is_accepted()){
        accepted_count++;
    } else {
        rejected_count++;
    }
    std::cout << " " << record << ", " << result.compute_units << " CU" << std::endl;
}

int main(int argc, char *argv[]) {
    namespace po = boost::program_options;
    int rounds;
    std::string mode_name;
    std::string config_file;
    std::string key_dir;
    unsigned long value;
    unsigned long threshold;
    uint64_t balance;
    uint64_t required_balance;
    verifier_config config;

    std::cout << "Threshold Scenario" << std::endl;
    po::options_description desc("Usage");
    po::variables_map vm;
    desc.add_options()
            ("help", "show help")
            ("generator", "Generate prover and verifier key")
            ("prover", "Compute and package proof")
            ("host", "Verify proof on the execution host")
            ("rounds", po::value<int>(&rounds)->default_value(1), "run complete scenario with number of rounds")
            ("mode", po::value<std::string>(&mode_name)->default_value("prepared"), "lite|prepared|standard")
            ("value", po::value<unsigned long>(&value)->default_value(42), "secret value")
            ("threshold", po::value<unsigned long>(&threshold)->default_value(18), "public threshold")
            ("disclose-value", "make the value a public input")
            ("balance", po::value<uint64_t>(&balance)->default_value(0), "balance of the prover account on the host")
            ("required-balance", po::value<uint64_t>(&required_balance), "submit VerifyProofWithBalance with this threshold")
            ("key-dir", po::value<std::string>(&key_dir)->default_value(""), "store and load keys as files in this directory")
            ("config", po::value<std::string>(&config_file), "host configuration file")
            ("file", "Write outputs to a file");
    po::options_description host_desc("Host");
    add_verifier_options(host_desc, config);
    desc.add(host_desc);

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("config")) {
            po::store(po::parse_config_file<char>(vm["config"].as<std::string>().c_str(), host_desc), vm);
        }
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (vm.count("help") || argc <= 1) {
        std::cout << desc << std::endl;
        return 1;
    }

    hostsnark_pp::init_public_params();

    // Disable profiling
#ifndef DEBUG
    libff::inhibit_profiling_info = true;
    libff::inhibit_profiling_counters = true;
#endif

    Communicator communicator;
    if(vm.count("file")){
        communicator = Communicator(Communicator::CommunicationMode::File);
    } else{
        communicator = Communicator(Communicator::CommunicationMode::Ram);
    }

    const bool disclose_value = vm.count("disclose-value") > 0;
    Generator gen(disclose_value, key_dir, "Generator", communicator);
    Prover prover(disclose_value, key_dir, "Prover", communicator);
    Host host(config, key_dir, "Host", communicator);

    try {
        prover.mode = parse_packaging_mode(mode_name);
        prover.value = value;
        prover.threshold = threshold;
        if (vm.count("required-balance")) {
            prover.required_balance = required_balance;
        }
        host.prover_balance = balance;

        if(vm.count("generator")) {
            std::cout << "generator ";
            gen.setup();
        }
        if (vm.count("prover")) {
            std::cout << "prover ";
            prover.setup();
        }
        if (vm.count("host")) {
            std::cout << "host ";
            host.setup();
        }
        std::cout << std::endl;

        long long start_time, end_time;

        start_time = libff::get_nsec_time();
        for(int i = 0; i < rounds; i++) {
            if (vm.count("prover") && !prover.run()) {
                return 1;
            }
            if (vm.count("host")) {
                host.run();
            }
            communicator.tick();
        }
        end_time = libff::get_nsec_time();

        std::cout << rounds << " rounds completed." << std::endl;
        if(vm.count("host")) {
            std::cout << "Host - Accepted: " << host.accepted_count << " Rejected: " << host.rejected_count
                      << " Aborted: " << host.aborted_count << std::endl;
        }
        std::cout << "Duration: " << (end_time - start_time) / 1000 << "us, = " << (end_time - start_time) / 1000 / std::max(rounds, 1) << "us per round" << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
